#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include "sardauscan/task/file_dialog.hpp"

using namespace sardauscan;

TEST(ConsoleFileDialog, test_prompt_shows_filter_description) {
    std::istringstream in("/abs/out.stl\n");
    std::ostringstream out;
    ConsoleFileDialog dialog(in, out);

    std::string answer = dialog.show_save_dialog("STL files (*.stl)|*.stl", "");

    EXPECT_EQ(answer, "/abs/out.stl");
    EXPECT_EQ(out.str(), "Save as [STL files (*.stl)]: ");
}

TEST(ConsoleFileDialog, test_relative_answer_joins_initial_directory) {
    std::istringstream in("  scan.scan  \n");
    std::ostringstream out;
    ConsoleFileDialog dialog(in, out);

    std::string answer = dialog.show_open_dialog("Sardauscan scan files (*.scan)|*.scan", "/data");

    EXPECT_EQ(answer, (std::filesystem::path("/data") / "scan.scan").string());
    EXPECT_EQ(out.str().rfind("Open [", 0), 0u);
}

TEST(ConsoleFileDialog, test_empty_line_or_end_of_input_is_no_choice) {
    std::istringstream in("\n");
    std::ostringstream out;
    ConsoleFileDialog dialog(in, out);

    EXPECT_EQ(dialog.show_save_dialog("XYZ point files (*.xyz)|*.xyz", "/data"), "");
    EXPECT_EQ(dialog.show_save_dialog("XYZ point files (*.xyz)|*.xyz", "/data"), "");
}

TEST(ConsoleFileDialog, test_answers_are_consumed_in_order) {
    std::istringstream in("first.ply\nsecond.ply\n");
    std::ostringstream out;
    ConsoleFileDialog dialog(in, out);

    EXPECT_EQ(dialog.show_save_dialog("PLY files (*.ply)|*.ply", ""), "first.ply");
    EXPECT_EQ(dialog.show_save_dialog("PLY files (*.ply)|*.ply", ""), "second.ply");
}
