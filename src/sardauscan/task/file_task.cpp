#include "sardauscan/task/file_task.hpp"

#include <filesystem>
#include <fmt/format.h>

namespace sardauscan {

const std::string& FileTask::get_filename() const {
    return filename;
}

void FileTask::set_filename(const std::string& filename) {
    this->filename = filename;
}

const std::string& FileTask::get_initial_directory() const {
    return initial_directory;
}

void FileTask::set_initial_directory(const std::string& directory) {
    initial_directory = directory;
}

void FileTask::set_settings_dialog(FileDialog* dialog) {
    settings_dialog = dialog;
}

std::string FileTask::display_name() const {
    if (!filename.empty()) {
        return fmt::format("{}: \"{}\"", verb(), std::filesystem::path(filename).filename().string());
    }
    return ProcessingTask::display_name();
}

bool FileTask::has_settings() const {
    return true;
}

bool FileTask::run_settings() {
    if (settings_dialog != nullptr) {
        std::string chosen = show_dialog(*settings_dialog);
        if (!chosen.empty()) {
            filename = chosen;
        }
    }
    return true;
}

void FileTask::write_settings(boost::property_tree::ptree& settings) const {
    settings.put("Filename", filename);
}

void FileTask::read_settings(const boost::property_tree::ptree& settings) {
    filename = settings.get("Filename", std::string());
}

bool FileTask::ensure_filename() {
    if (filename.empty() && caller_control != nullptr) {
        std::string chosen = show_dialog(*caller_control);
        if (!chosen.empty()) {
            filename = chosen;
        }
    }
    return !filename.empty();
}

void FileTask::report_invalid_file() {
    set_last_error(fmt::format("Invalid File {}", filename));
    set_status(TaskStatus::Error);
}

}  // namespace sardauscan
