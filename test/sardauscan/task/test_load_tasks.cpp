#include <gtest/gtest.h>
#include <fstream>
#include <pcl/io/pcd_io.h>
#include "sardauscan/task/load_tasks.hpp"
#include "sardauscan/test_helpers.hpp"

using namespace sardauscan;

TEST(LoadTasks, test_kinds_and_names) {
    LoadPoints points;
    LoadMesh mesh;
    LoadPcd pcd;

    EXPECT_EQ(points.in(), TaskItem::None);
    EXPECT_EQ(points.out(), TaskItem::ScanLines);
    EXPECT_EQ(mesh.out(), TaskItem::Mesh);
    EXPECT_EQ(pcd.out(), TaskItem::ScanLines);
    EXPECT_EQ(points.task_type(), TaskType::Input);
    EXPECT_EQ(points.name(), "Load .scan");
    EXPECT_EQ(pcd.name(), "Load .pcd");
    EXPECT_EQ(pcd.dialog_filter(), "PCD point cloud files (*.pcd)|*.pcd");
}

TEST(LoadTasks, test_load_points_reads_native_file) {
    // Arrange
    test::TempDir dir;
    ScanDataIO().write(dir.file("lines.scan"), *test::make_lines_data());
    LoadPoints task;
    task.set_filename(dir.file("lines.scan"));

    // Act
    ScanDataPtr result = task.run(nullptr);

    // Assert
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Finished);
    EXPECT_EQ(result->get_lines().size(), 2u);
    EXPECT_EQ(result->point_count(), 4u);
}

TEST(LoadTasks, test_open_dialog_is_asked_when_no_file) {
    test::TempDir dir;
    ScanDataIO().write(dir.file("lines.scan"), *test::make_lines_data());
    LoadPoints task;
    task.set_initial_directory(dir.path.string());
    test::ScriptedFileDialog dialog(dir.file("lines.scan"));

    ScanDataPtr result = task.run(nullptr, &dialog);

    ASSERT_NE(result, nullptr);
    EXPECT_EQ(dialog.open_calls, 1);
    EXPECT_EQ(dialog.save_calls, 0);
    EXPECT_EQ(dialog.last_directory, dir.path.string());
    EXPECT_EQ(task.display_name(), "Load: \"lines.scan\"");
}

TEST(LoadTasks, test_no_file_is_invalid_file) {
    LoadPoints task;

    ScanDataPtr result = task.run(nullptr);

    EXPECT_EQ(result, nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
    EXPECT_EQ(task.get_last_error(), "Invalid File ");
}

TEST(LoadTasks, test_missing_file_is_error) {
    test::TempDir dir;
    LoadPoints task;
    task.set_filename(dir.file("absent.scan"));

    EXPECT_EQ(task.run(nullptr), nullptr);
    EXPECT_EQ(task.get_status(), TaskStatus::Error);
}

TEST(LoadTasks, test_load_mesh_requires_faces) {
    test::TempDir dir;
    ScanDataIO().write(dir.file("lines.scan"), *test::make_lines_data());
    ScanDataIO().write(dir.file("mesh.scan"), *test::make_mesh_data());
    LoadMesh without_faces;
    without_faces.set_filename(dir.file("lines.scan"));
    LoadMesh with_faces;
    with_faces.set_filename(dir.file("mesh.scan"));

    EXPECT_EQ(without_faces.run(nullptr), nullptr);
    EXPECT_EQ(without_faces.get_status(), TaskStatus::Error);

    ScanDataPtr mesh = with_faces.run(nullptr);
    ASSERT_NE(mesh, nullptr);
    EXPECT_EQ(mesh->get_faces().size(), 2u);
}

TEST(LoadTasks, test_load_pcd_makes_single_line) {
    test::TempDir dir;
    pcl::PointCloud<pcl::PointXYZ> cloud;
    cloud.push_back(pcl::PointXYZ(1.f, 2.f, 3.f));
    cloud.push_back(pcl::PointXYZ(4.f, 5.f, 6.f));
    cloud.push_back(pcl::PointXYZ(7.f, 8.f, 9.f));
    pcl::io::savePCDFileASCII(dir.file("cloud.pcd"), cloud);
    LoadPcd task;
    task.set_filename(dir.file("cloud.pcd"));

    ScanDataPtr result = task.run(nullptr);

    ASSERT_NE(result, nullptr);
    ASSERT_EQ(result->get_lines().size(), 1u);
    EXPECT_EQ(result->point_count(), 3u);
    EXPECT_FLOAT_EQ(result->get_lines()[0].points[2].z, 9.f);
}
