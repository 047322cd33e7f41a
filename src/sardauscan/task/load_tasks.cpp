#include "sardauscan/task/load_tasks.hpp"

#include <stdexcept>

#include "sardauscan/utils/logging.hpp"

namespace sardauscan {

TaskItem LoadPoints::in() const {
    return TaskItem::None;
}

TaskItem LoadPoints::out() const {
    return TaskItem::ScanLines;
}

TaskType LoadPoints::task_type() const {
    return TaskType::Input;
}

std::string LoadPoints::type_name() const {
    return "LoadPoints";
}

std::string LoadPoints::name() const {
    return "Load " + reader().extension();
}

std::unique_ptr<ProcessingTask> LoadPoints::clone() const {
    return std::make_unique<LoadPoints>();
}

std::string LoadPoints::dialog_filter() const {
    return reader().dialog_filter();
}

std::string LoadPoints::verb() const {
    return "Load";
}

std::string LoadPoints::show_dialog(FileDialog& dialog) const {
    return dialog.show_open_dialog(dialog_filter(), get_initial_directory());
}

ScanDataPtr LoadPoints::do_task(ScanDataPtr /*source*/) {
    set_last_error("");
    if (!ensure_filename()) {
        report_invalid_file();
        return nullptr;
    }

    update_percent(0, nullptr);
    ScanDataPtr data = reader().read(get_filename());
    check_loaded(*data);
    update_percent(100, data);
    SDS_INFO("[{}] Read {} from {}", type_name(), data->to_string(), get_filename());
    return data;
}

void LoadPoints::check_loaded(const ScanData& data) const {
    if (data.get_lines().empty()) {
        throw std::runtime_error("No scan line in " + get_filename());
    }
}

const ScanDataReader& LoadPoints::reader() const {
    static const ScanDataIO io;
    return io;
}

// ------- LoadMesh -------

TaskItem LoadMesh::out() const {
    return TaskItem::Mesh;
}

std::string LoadMesh::type_name() const {
    return "LoadMesh";
}

std::unique_ptr<ProcessingTask> LoadMesh::clone() const {
    return std::make_unique<LoadMesh>();
}

void LoadMesh::check_loaded(const ScanData& data) const {
    if (!data.has_mesh()) {
        throw std::runtime_error("No mesh in " + get_filename());
    }
}

// ------- LoadPcd -------

std::string LoadPcd::type_name() const {
    return "LoadPcd";
}

std::unique_ptr<ProcessingTask> LoadPcd::clone() const {
    return std::make_unique<LoadPcd>();
}

const ScanDataReader& LoadPcd::reader() const {
    static const PcdIO io;
    return io;
}

}  // namespace sardauscan
