#pragma once

#include "sardauscan/io/format_io.hpp"
#include "sardauscan/task/file_task.hpp"

namespace sardauscan {

// Load scan lines from a native scan file; always first in a pipeline
class LoadPoints : public FileTask {
    public:
        TaskItem in() const override;
        TaskItem out() const override;
        TaskType task_type() const override;
        std::string type_name() const override;
        std::string name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
        std::string dialog_filter() const override;

    protected:
        ScanDataPtr do_task(ScanDataPtr source) override;
        std::string verb() const override;
        std::string show_dialog(FileDialog& dialog) const override;

        // Throws if the loaded data does not match out()
        virtual void check_loaded(const ScanData& data) const;
        virtual const ScanDataReader& reader() const;
};

class LoadMesh : public LoadPoints {
    public:
        TaskItem out() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
    protected:
        void check_loaded(const ScanData& data) const override;
};

class LoadPcd : public LoadPoints {
    public:
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
    protected:
        const ScanDataReader& reader() const override;
};

}  // namespace sardauscan
