#include "sardauscan/task/processing_task.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/property_tree/xml_parser.hpp>
#include <fmt/format.h>

#include "sardauscan/utils/logging.hpp"

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace sardauscan {

std::string to_string(TaskType type) {
    switch (type) {
        case TaskType::Input: return "Input";
        case TaskType::Filter: return "Filter";
        case TaskType::Transform: return "Transform";
        case TaskType::Smooth: return "Smooth";
        case TaskType::MeshBuild: return "MeshBuild";
        case TaskType::Color: return "Color";
        case TaskType::IO: return "IO";
        case TaskType::UnknownTask: break;
    }
    return "UnknownTask";
}

std::string to_string(TaskItem item) {
    switch (item) {
        case TaskItem::ScanLines: return "ScanLines";
        case TaskItem::Mesh: return "Mesh";
        case TaskItem::None: break;
    }
    return "None";
}

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Working: return "Working";
        case TaskStatus::Finished: return "Finished";
        case TaskStatus::Error: return "Error";
        case TaskStatus::None: break;
    }
    return "None";
}

ProcessingTask::ProcessingTask()
    : status(TaskStatus::None), percent(0)
{}

TaskType ProcessingTask::task_type() const {
    return TaskType::UnknownTask;
}

std::string ProcessingTask::display_name() const {
    return name();
}

std::string ProcessingTask::to_string() const {
    return display_name();
}

TaskStatus ProcessingTask::get_status() const {
    return status;
}

int ProcessingTask::get_percent() const {
    return percent;
}

std::string ProcessingTask::get_last_error() const {
    std::lock_guard<std::mutex> lock(error_padlock);
    return last_error;
}

bool ProcessingTask::ready() const {
    return true;
}

bool ProcessingTask::browsable() const {
    return true;
}

std::string ProcessingTask::tooltip() const {
    switch (get_status()) {
        case TaskStatus::Finished:
            return "Finished";
        case TaskStatus::Working:
            return fmt::format("Working : {}%", get_percent());
        case TaskStatus::Error:
            return "Error :" + get_last_error();
        case TaskStatus::None:
            break;
    }
    if (ready()) {
        return sardauscan::to_string(task_type()) + ": " + display_name();
    }
    return "Missings Ressource to run task";
}

bool ProcessingTask::has_settings() const {
    pt::ptree settings;
    write_settings(settings);
    return !settings.empty();
}

bool ProcessingTask::run_settings() {
    return false;
}

void ProcessingTask::prepare_to_run() {
    status = TaskStatus::None;
    percent = 0;
}

ScanDataPtr ProcessingTask::run(ScanDataPtr source, FileDialog* control, BackgroundWorker* worker, WorkerArgs* worker_arg, ProgressCallback update_func) {
    set_last_error("");
    this->caller_control = control;
    this->worker = worker;
    this->worker_arg = worker_arg;
    this->update_func = std::move(update_func);

    ScanDataPtr ret = nullptr;
    status = TaskStatus::Working;
    update_percent(0, ret);
    try {
        ret = do_task(source);
    } catch (std::exception& e) {
        set_last_error(e.what());
        status = TaskStatus::Error;
        SDS_ERROR("[{}] {}", display_name(), e.what());
        release_run_context();
        return nullptr;
    }

    if (status != TaskStatus::Error) {
        status = TaskStatus::Finished;
        update_percent(100, ret);
    } else {
        SDS_ERROR("[{}] {}", display_name(), get_last_error());
        ret = nullptr;
    }
    release_run_context();
    return ret;
}

void ProcessingTask::update_percent(int percent, const ScanDataPtr& data) {
    if (this->percent != percent) {
        this->percent = percent;
        if (update_func) {
            update_func(*this, percent, data);
        }
    }
}

void ProcessingTask::release_run_context() {
    update_func = nullptr;
    caller_control = nullptr;
    worker = nullptr;
    worker_arg = nullptr;
}

void ProcessingTask::set_status(TaskStatus status) {
    this->status = status;
}

void ProcessingTask::set_last_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_padlock);
    last_error = error;
}

bool ProcessingTask::cancel_pending() const {
    if (worker != nullptr && worker->cancellation_pending()) {
        if (worker_arg != nullptr) {
            worker_arg->cancel = true;
        }
        return true;
    }
    return false;
}

bool ProcessingTask::can_insert(const ProcessingTask* prev, const ProcessingTask* next) const {
    const bool in_ok = prev == nullptr ? in() == TaskItem::None : in() == prev->out();
    const bool out_ok = next == nullptr ? true : out() == next->in();
    return in_ok && out_ok;
}

bool ProcessingTask::can_insert(TaskItem prev_out, TaskItem next_in) const {
    return in() == prev_out && out() == next_in;
}

bool ProcessingTask::can_follow(TaskItem item) const {
    return in() == item;
}

bool ProcessingTask::can_follow(const ProcessingTask& other) const {
    return can_follow(other.out());
}

int ProcessingTask::compare_to(const ProcessingTask& other) const {
    auto compare = [](auto a, auto b) { return a < b ? -1 : (b < a ? 1 : 0); };

    int c = compare(task_type(), other.task_type());
    if (c == 0)
        c = compare(in(), other.in());
    if (c == 0)
        c = compare(out(), other.out());
    if (c == 0)
        c = compare(display_name(), other.display_name());
    return c;
}

bool ProcessingTask::operator<(const ProcessingTask& other) const {
    return compare_to(other) < 0;
}

std::string ProcessingTask::config_file_name() const {
    return type_name() + ".config.xml";
}

void ProcessingTask::write_settings(pt::ptree& /*settings*/) const {
}

void ProcessingTask::read_settings(const pt::ptree& /*settings*/) {
}

std::string ProcessingTask::to_xml() const {
    pt::ptree settings;
    write_settings(settings);

    pt::ptree document;
    document.add_child(type_name(), settings);

    std::ostringstream xml;
    pt::write_xml(xml, document, pt::xml_writer_make_settings<std::string>(' ', 2));
    return xml.str();
}

/**
 * @brief Load settings from an XML document produced by to_xml().
 *
 * The settings are first applied to a fresh clone, so a document that cannot be read leaves this
 * task untouched.
 *
 * @return false if the document is malformed or belongs to another task type.
 */
bool ProcessingTask::load_from_xml(const std::string& xml) {
    try {
        std::istringstream stream(xml);
        pt::ptree document;
        pt::read_xml(stream, document, pt::xml_parser::trim_whitespace);

        auto root = document.get_child_optional(type_name());
        if (!root) {
            SDS_WARN("[{}] Settings document has no <{}> element, keeping current settings", type_name(), type_name());
            return false;
        }

        auto trial = clone();
        trial->read_settings(*root);
        read_settings(*root);
    } catch (std::exception& e) {
        SDS_WARN("[{}] Cannot load settings, keeping current settings: {}", type_name(), e.what());
        return false;
    }
    return true;
}

void ProcessingTask::save_to_file(const std::string& settings_directory) const {
    if (!fs::exists(settings_directory)) {
        fs::create_directories(settings_directory);
    }

    const fs::path filename = fs::path(settings_directory) / config_file_name();
    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + filename.string());
    }
    out_file << to_xml();
}

bool ProcessingTask::load_from_file(const std::string& settings_directory) {
    const fs::path filename = fs::path(settings_directory) / config_file_name();
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        if (ec) {
            SDS_WARN("[{}] Cannot access settings file {}: {}", type_name(), filename.string(), ec.message());
        }
        return false;
    }

    std::ifstream in_file(filename);
    if (!in_file.is_open()) {
        SDS_WARN("[{}] Cannot open settings file {}", type_name(), filename.string());
        return false;
    }
    std::stringstream content;
    content << in_file.rdbuf();
    return load_from_xml(content.str());
}

}  // namespace sardauscan
