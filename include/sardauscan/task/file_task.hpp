#pragma once

#include <string>
#include "sardauscan/task/processing_task.hpp"

namespace sardauscan {

/**
 * @brief Common part of the tasks reading or writing a file.
 *
 * The target file is persisted as the "Filename" setting. When it is empty at run time the task
 * asks the FileDialog given to run(); without a dialog no file can be chosen.
 */
class FileTask : public ProcessingTask {
    public:
        const std::string& get_filename() const;
        void set_filename(const std::string& filename);

        const std::string& get_initial_directory() const;
        void set_initial_directory(const std::string& directory);

        // Dialog used by run_settings(), outside of a run
        void set_settings_dialog(FileDialog* dialog);

        virtual std::string dialog_filter() const = 0;

        std::string display_name() const override;
        bool has_settings() const override;
        bool run_settings() override;

        void write_settings(boost::property_tree::ptree& settings) const override;
        void read_settings(const boost::property_tree::ptree& settings) override;

    protected:
        // "Save" or "Load", shown in front of the file name
        virtual std::string verb() const = 0;
        virtual std::string show_dialog(FileDialog& dialog) const = 0;

        // Prompts through the run's dialog if no file is set; false if there is still none
        bool ensure_filename();
        void report_invalid_file();

    private:
        std::string filename;
        std::string initial_directory;
        FileDialog* settings_dialog = nullptr;
};

}  // namespace sardauscan
