#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace sardauscan {

/**
 * @brief Host-side prompt used by tasks that need a file path.
 *
 * Implementations may forward the request to another thread (e.g. a UI thread); the calling thread
 * blocks until an answer is available. An empty string means the user did not choose a file.
 */
class FileDialog {
    public:
        virtual ~FileDialog() = default;
        virtual std::string show_save_dialog(const std::string& filter, const std::string& initial_directory) = 0;
        virtual std::string show_open_dialog(const std::string& filter, const std::string& initial_directory) = 0;
};

// Prompts on a text stream, one answer per line. Relative answers are resolved against the initial directory.
class ConsoleFileDialog : public FileDialog {
    public:
        ConsoleFileDialog(std::istream& in = std::cin, std::ostream& out = std::cout);

        std::string show_save_dialog(const std::string& filter, const std::string& initial_directory) override;
        std::string show_open_dialog(const std::string& filter, const std::string& initial_directory) override;
    private:
        std::istream& in;
        std::ostream& out;
        std::mutex padlock;

        std::string prompt(const std::string& title, const std::string& filter, const std::string& initial_directory);
};

}  // namespace sardauscan
