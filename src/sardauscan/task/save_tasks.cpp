#include "sardauscan/task/save_tasks.hpp"

#include <stdexcept>

#include "sardauscan/utils/logging.hpp"

namespace sardauscan {

// ------- SavePoints -------

TaskItem SavePoints::in() const {
    return TaskItem::ScanLines;
}

TaskItem SavePoints::out() const {
    return TaskItem::None;
}

TaskType SavePoints::task_type() const {
    return TaskType::IO;
}

std::string SavePoints::type_name() const {
    return "SavePoints";
}

std::string SavePoints::name() const {
    return "Save " + writer().extension();
}

std::unique_ptr<ProcessingTask> SavePoints::clone() const {
    return std::make_unique<SavePoints>();
}

std::string SavePoints::dialog_filter() const {
    return writer().dialog_filter();
}

std::string SavePoints::verb() const {
    return "Save";
}

std::string SavePoints::show_dialog(FileDialog& dialog) const {
    return dialog.show_save_dialog(dialog_filter(), get_initial_directory());
}

ScanDataPtr SavePoints::do_task(ScanDataPtr source) {
    set_last_error("");
    if (!source) {
        throw std::invalid_argument(name() + " needs scan data to save");
    }

    if (!ensure_filename()) {
        report_invalid_file();
        return source;
    }

    if (cancel_pending()) {
        set_last_error("Cancelled");
        set_status(TaskStatus::Error);
        return source;
    }

    set_status(TaskStatus::Working);
    update_percent(0, source);
    save(*source);
    set_status(TaskStatus::Finished);
    update_percent(100, source);
    SDS_INFO("[{}] Wrote {} to {}", type_name(), source->to_string(), get_filename());
    return source;
}

void SavePoints::save(const ScanData& source) {
    writer().write(get_filename(), source);
}

const ScanDataWriter& SavePoints::writer() const {
    static const ScanDataIO io;
    return io;
}

// ------- SaveMesh -------

TaskItem SaveMesh::in() const {
    return TaskItem::Mesh;
}

std::string SaveMesh::type_name() const {
    return "SaveMesh";
}

std::unique_ptr<ProcessingTask> SaveMesh::clone() const {
    return std::make_unique<SaveMesh>();
}

// ------- SaveStl -------

TaskItem SaveStl::in() const {
    return TaskItem::Mesh;
}

std::string SaveStl::type_name() const {
    return "SaveStl";
}

std::unique_ptr<ProcessingTask> SaveStl::clone() const {
    return std::make_unique<SaveStl>();
}

const ScanDataWriter& SaveStl::writer() const {
    static const StlIO io;
    return io;
}

// ------- SavePly -------

TaskItem SavePly::in() const {
    return TaskItem::ScanLines;
}

std::string SavePly::type_name() const {
    return "SavePly";
}

std::unique_ptr<ProcessingTask> SavePly::clone() const {
    return std::make_unique<SavePly>();
}

const ScanDataWriter& SavePly::writer() const {
    static const PlyIO io;
    return io;
}

// ------- SaveXyz -------

TaskItem SaveXyz::in() const {
    return TaskItem::ScanLines;
}

std::string SaveXyz::type_name() const {
    return "SaveXyz";
}

std::unique_ptr<ProcessingTask> SaveXyz::clone() const {
    return std::make_unique<SaveXyz>();
}

bool SaveXyz::browsable() const {
    return false;
}

const ScanDataWriter& SaveXyz::writer() const {
    static const XyzIO io;
    return io;
}

// ------- SaveObj -------

TaskItem SaveObj::in() const {
    return TaskItem::Mesh;
}

std::string SaveObj::type_name() const {
    return "SaveObj";
}

std::unique_ptr<ProcessingTask> SaveObj::clone() const {
    return std::make_unique<SaveObj>();
}

const ScanDataWriter& SaveObj::writer() const {
    static const WaveFormIO io;
    return io;
}

}  // namespace sardauscan
