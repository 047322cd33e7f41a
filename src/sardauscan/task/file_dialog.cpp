#include "sardauscan/task/file_dialog.hpp"

#include <filesystem>
#include <boost/algorithm/string/trim.hpp>

namespace fs = std::filesystem;

namespace sardauscan {

ConsoleFileDialog::ConsoleFileDialog(std::istream& in, std::ostream& out)
    : in(in), out(out)
{}

std::string ConsoleFileDialog::show_save_dialog(const std::string& filter, const std::string& initial_directory) {
    return prompt("Save as", filter, initial_directory);
}

std::string ConsoleFileDialog::show_open_dialog(const std::string& filter, const std::string& initial_directory) {
    return prompt("Open", filter, initial_directory);
}

std::string ConsoleFileDialog::prompt(const std::string& title, const std::string& filter, const std::string& initial_directory) {
    std::lock_guard<std::mutex> lock(padlock);

    // Only the description part of "description|pattern" is shown
    const std::string description = filter.substr(0, filter.find('|'));
    out << title << " [" << description << "]: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        return "";
    }
    boost::algorithm::trim(answer);
    if (answer.empty()) {
        return "";
    }

    fs::path path(answer);
    if (path.is_relative() && !initial_directory.empty()) {
        path = fs::path(initial_directory) / path;
    }
    return path.string();
}

}  // namespace sardauscan
