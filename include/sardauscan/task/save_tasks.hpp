#pragma once

#include "sardauscan/io/format_io.hpp"
#include "sardauscan/task/file_task.hpp"

namespace sardauscan {

// Save scan lines in the native scan format
class SavePoints : public FileTask {
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

        virtual void save(const ScanData& source);
        virtual const ScanDataWriter& writer() const;
};

// Save a mesh in the native scan format
class SaveMesh : public SavePoints {
    public:
        TaskItem in() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
};

class SaveStl : public SaveMesh {
    public:
        TaskItem in() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
    protected:
        const ScanDataWriter& writer() const override;
};

class SavePly : public SaveMesh {
    public:
        TaskItem in() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
    protected:
        const ScanDataWriter& writer() const override;
};

class SaveXyz : public SaveMesh {
    public:
        TaskItem in() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
        bool browsable() const override;
    protected:
        const ScanDataWriter& writer() const override;
};

class SaveObj : public SaveMesh {
    public:
        TaskItem in() const override;
        std::string type_name() const override;
        std::unique_ptr<ProcessingTask> clone() const override;
    protected:
        const ScanDataWriter& writer() const override;
};

}  // namespace sardauscan
