#include <gtest/gtest.h>
#include <filesystem>
#include "sardauscan/task/save_tasks.hpp"
#include "sardauscan/test_helpers.hpp"

using namespace sardauscan;

TEST(SaveTasks, test_names_and_kinds) {
    SavePoints points;
    SaveMesh mesh;
    SaveStl stl;
    SavePly ply;
    SaveXyz xyz;
    SaveObj obj;

    EXPECT_EQ(points.name(), "Save .scan");
    EXPECT_EQ(mesh.name(), "Save .scan");
    EXPECT_EQ(stl.name(), "Save .stl");
    EXPECT_EQ(ply.name(), "Save .ply");
    EXPECT_EQ(xyz.name(), "Save .xyz");
    EXPECT_EQ(obj.name(), "Save .obj");

    EXPECT_EQ(points.in(), TaskItem::ScanLines);
    EXPECT_EQ(mesh.in(), TaskItem::Mesh);
    EXPECT_EQ(stl.in(), TaskItem::Mesh);
    EXPECT_EQ(ply.in(), TaskItem::ScanLines);
    EXPECT_EQ(xyz.in(), TaskItem::ScanLines);
    EXPECT_EQ(obj.in(), TaskItem::Mesh);

    for (const ProcessingTask* task : std::initializer_list<const ProcessingTask*>{&points, &mesh, &stl, &ply, &xyz, &obj}) {
        EXPECT_EQ(task->out(), TaskItem::None);
        EXPECT_EQ(task->task_type(), TaskType::IO);
    }
}

TEST(SaveTasks, test_dialog_filters) {
    EXPECT_EQ(SavePoints().dialog_filter(), "Sardauscan scan files (*.scan)|*.scan");
    EXPECT_EQ(SaveStl().dialog_filter(), "STL files (*.stl)|*.stl");
    EXPECT_EQ(SaveObj().dialog_filter(), "Wavefront OBJ files (*.obj)|*.obj");
}

TEST(SaveTasks, test_only_xyz_is_hidden) {
    EXPECT_FALSE(SaveXyz().browsable());
    EXPECT_TRUE(SavePly().browsable());
    EXPECT_TRUE(SaveStl().browsable());
}

TEST(SaveTasks, test_display_name_shows_file_name) {
    SaveStl task;
    EXPECT_EQ(task.display_name(), "Save .stl");

    task.set_filename("/some/dir/part.stl");

    EXPECT_EQ(task.display_name(), "Save: \"part.stl\"");
    EXPECT_EQ(task.to_string(), task.display_name());
}

TEST(SaveTasks, test_clone_is_fresh_instance_of_same_type) {
    SaveObj task;
    task.set_filename("a.obj");

    auto copy = task.clone();

    ASSERT_NE(dynamic_cast<SaveObj*>(copy.get()), nullptr);
    EXPECT_EQ(copy->type_name(), "SaveObj");
    EXPECT_EQ(static_cast<SaveObj&>(*copy).get_filename(), "");
}

TEST(SaveTasks, test_no_file_and_no_dialog_is_invalid_file) {
    SavePly task;

    ScanDataPtr result = task.run(test::make_lines_data());

    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
    EXPECT_EQ(task.get_last_error().rfind("Invalid File ", 0), 0u);
}

TEST(SaveTasks, test_empty_dialog_answer_is_invalid_file) {
    SavePly task;
    test::ScriptedFileDialog dialog("");

    ScanDataPtr result = task.run(test::make_lines_data(), &dialog);

    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(dialog.save_calls, 1);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
}

TEST(SaveTasks, test_dialog_answer_is_used_and_kept) {
    // Arrange
    test::TempDir dir;
    SaveXyz task;
    task.set_initial_directory(dir.path.string());
    test::ScriptedFileDialog dialog(dir.file("points.xyz"));
    auto data = test::make_lines_data();

    // Act
    ScanDataPtr result = task.run(data, &dialog);

    // Assert
    EXPECT_EQ(result, data);
    EXPECT_EQ(task.get_status(), TaskStatus::Finished);
    EXPECT_EQ(task.get_percent(), 100);
    EXPECT_EQ(dialog.save_calls, 1);
    EXPECT_EQ(dialog.last_filter, "XYZ point files (*.xyz)|*.xyz");
    EXPECT_EQ(dialog.last_directory, dir.path.string());
    EXPECT_EQ(task.get_filename(), dir.file("points.xyz"));
    EXPECT_TRUE(std::filesystem::exists(dir.file("points.xyz")));
}

TEST(SaveTasks, test_set_filename_skips_dialog) {
    test::TempDir dir;
    SaveObj task;
    task.set_filename(dir.file("mesh.obj"));
    test::ScriptedFileDialog dialog(dir.file("other.obj"));

    task.run(test::make_mesh_data(), &dialog);

    EXPECT_EQ(dialog.save_calls, 0);
    EXPECT_EQ(task.get_status(), TaskStatus::Finished);
    EXPECT_TRUE(std::filesystem::exists(dir.file("mesh.obj")));
    EXPECT_FALSE(std::filesystem::exists(dir.file("other.obj")));
}

TEST(SaveTasks, test_native_save_reads_back) {
    test::TempDir dir;
    SaveMesh task;
    task.set_filename(dir.file("model.scan"));

    task.run(test::make_mesh_data());

    ASSERT_EQ(task.get_status(), TaskStatus::Finished);
    ScanDataPtr back = ScanDataIO().read(dir.file("model.scan"));
    EXPECT_EQ(back->point_count(), 4u);
    EXPECT_EQ(back->get_faces().size(), 2u);
}

TEST(SaveTasks, test_null_source_is_error) {
    test::TempDir dir;
    SavePoints task;
    task.set_filename(dir.file("none.scan"));

    ScanDataPtr result = task.run(nullptr);

    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
    EXPECT_FALSE(std::filesystem::exists(dir.file("none.scan")));
}

TEST(SaveTasks, test_writer_failure_is_error) {
    test::TempDir dir;
    SaveStl task;
    task.set_filename(dir.file("no_faces.stl"));

    ScanDataPtr result = task.run(test::make_lines_data());

    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
    EXPECT_FALSE(task.get_last_error().empty());
}

TEST(SaveTasks, test_unwritable_path_is_error) {
    test::TempDir dir;
    SavePly task;
    task.set_filename(dir.file("missing_dir/out.ply"));

    task.run(test::make_lines_data());

    EXPECT_EQ(task.get_status(), TaskStatus::Error);
}

TEST(SaveTasks, test_cancelled_before_writing) {
    // Arrange
    test::TempDir dir;
    SavePly task;
    task.set_filename(dir.file("cancelled.ply"));
    BackgroundWorker worker;
    WorkerArgs args;
    worker.cancel_async();

    // Act
    ScanDataPtr result = task.run(test::make_lines_data(), nullptr, &worker, &args);

    // Assert
    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
    EXPECT_EQ(task.get_last_error(), "Cancelled");
    EXPECT_TRUE(args.cancel);
    EXPECT_FALSE(std::filesystem::exists(dir.file("cancelled.ply")));
}

TEST(SaveTasks, test_run_settings_uses_settings_dialog) {
    SaveStl task;
    test::ScriptedFileDialog dialog("/out/chosen.stl");

    EXPECT_TRUE(task.run_settings());
    EXPECT_EQ(task.get_filename(), "");

    task.set_settings_dialog(&dialog);
    EXPECT_TRUE(task.run_settings());
    EXPECT_EQ(task.get_filename(), "/out/chosen.stl");
    EXPECT_EQ(dialog.last_filter, task.dialog_filter());
}
