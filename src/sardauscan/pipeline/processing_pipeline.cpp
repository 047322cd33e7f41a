#include "sardauscan/pipeline/processing_pipeline.hpp"

#include <fstream>
#include <stdexcept>
#include <boost/property_tree/ptree.hpp>

#include "sardauscan/utils/logging.hpp"
#include "sardauscan/utils/stopwatch.hpp"

using json = nlohmann::json;
namespace pt = boost::property_tree;

namespace sardauscan {

bool ProcessingPipeline::can_insert(size_t index, const ProcessingTask& task) const {
    if (index > tasks.size()) {
        return false;
    }
    // A task taking no input only starts a pipeline, and nothing goes in front of it
    if (index > 0 && task.in() == TaskItem::None) {
        return false;
    }
    if (index == 0 && !tasks.empty() && tasks.front()->in() == TaskItem::None) {
        return false;
    }
    const ProcessingTask* prev = index == 0 ? nullptr : tasks[index - 1].get();
    const ProcessingTask* next = index == tasks.size() ? nullptr : tasks[index].get();
    return task.can_insert(prev, next);
}

bool ProcessingPipeline::insert(size_t index, std::unique_ptr<ProcessingTask> task) {
    if (!task || !can_insert(index, *task)) {
        return false;
    }
    tasks.insert(tasks.begin() + index, std::move(task));
    return true;
}

bool ProcessingPipeline::append(std::unique_ptr<ProcessingTask> task) {
    return insert(tasks.size(), std::move(task));
}

std::unique_ptr<ProcessingTask> ProcessingPipeline::remove(size_t index) {
    if (index >= tasks.size()) {
        throw std::out_of_range("No task at index " + std::to_string(index));
    }
    std::unique_ptr<ProcessingTask> task = std::move(tasks[index]);
    tasks.erase(tasks.begin() + index);
    return task;
}

void ProcessingPipeline::clear() {
    tasks.clear();
}

size_t ProcessingPipeline::size() const {
    return tasks.size();
}

bool ProcessingPipeline::empty() const {
    return tasks.empty();
}

ProcessingTask& ProcessingPipeline::at(size_t index) {
    return *tasks.at(index);
}

const ProcessingTask& ProcessingPipeline::at(size_t index) const {
    return *tasks.at(index);
}

const std::vector<std::unique_ptr<ProcessingTask>>& ProcessingPipeline::get_tasks() const {
    return tasks;
}

bool ProcessingPipeline::is_valid() const {
    for (size_t i = 0; i < tasks.size(); i++) {
        const ProcessingTask* prev = i == 0 ? nullptr : tasks[i - 1].get();
        const ProcessingTask* next = i + 1 == tasks.size() ? nullptr : tasks[i + 1].get();
        if (i > 0 && tasks[i]->in() == TaskItem::None) {
            return false;
        }
        if (!tasks[i]->can_insert(prev, next)) {
            return false;
        }
    }
    return true;
}

ScanDataPtr ProcessingPipeline::run(ScanDataPtr source, FileDialog* control, BackgroundWorker* worker, WorkerArgs* worker_arg, ProcessingTask::ProgressCallback update_func) {
    if (!is_valid()) {
        SDS_ERROR("[PIPELINE] Tasks are not compatible with each other, nothing is run.");
        return nullptr;
    }

    for (auto& task : tasks) {
        task->prepare_to_run();
    }

    ScanDataPtr data = source;
    Stopwatch total;
    for (size_t i = 0; i < tasks.size(); i++) {
        SDS_ASSERT(tasks[i] != nullptr);
        ProcessingTask& task = *tasks[i];

        if (worker != nullptr && worker->cancellation_pending()) {
            if (worker_arg != nullptr) {
                worker_arg->cancel = true;
            }
            SDS_WARN("[PIPELINE] Cancelled before {}", task.display_name());
            return nullptr;
        }

        SDS_INFO("[PIPELINE] Executing {} ({}/{})...", task.display_name(), i + 1, tasks.size());
        Stopwatch stopwatch;
        ScanDataPtr result = task.run(data, control, worker, worker_arg, update_func);
        if (task.get_status() == TaskStatus::Error) {
            SDS_ERROR("[PIPELINE] {} failed: {}", task.display_name(), task.get_last_error());
            return nullptr;
        }
        SDS_INFO("[PIPELINE] {} completed in {:.3f}s", task.display_name(), stopwatch.ellapsed());
        data = result;
    }

    SDS_INFO("[PIPELINE] {} tasks completed in {:.3f}s", tasks.size(), total.ellapsed());
    return data;
}

json ProcessingPipeline::serialize_task(const ProcessingTask& task) const {
    pt::ptree settings;
    task.write_settings(settings);

    json task_json = {};
    task_json["type"] = task.type_name();
    task_json["settings"] = json::object();
    for (const auto& [key, value] : settings) {
        task_json["settings"][key] = value.data();
    }
    return task_json;
}

json ProcessingPipeline::to_json() const {
    json pipeline_json = {};
    pipeline_json["tasks"] = json::array();
    for (const auto& task : tasks) {
        pipeline_json["tasks"].push_back(serialize_task(*task));
    }
    return pipeline_json;
}

std::unique_ptr<ProcessingTask> ProcessingPipeline::deserialize_task(const json& task_json, const TaskFactory& factory) {
    const std::string type = task_json.at("type").get<std::string>();
    if (!factory.contains(type)) {
        throw std::runtime_error("Unknown task type in pipeline: " + type);
    }
    auto task = factory.create(type);

    if (task_json.contains("settings")) {
        pt::ptree settings;
        for (const auto& [key, value] : task_json["settings"].items()) {
            settings.put(pt::ptree::path_type(key, '\0'), value.is_string() ? value.get<std::string>() : value.dump());
        }
        task->read_settings(settings);
    }
    return task;
}

/**
 * @brief Build a pipeline from its JSON description: {"tasks": [{"type": ..., "settings": {...}}, ...]}
 *
 * @throws std::runtime_error If the description is malformed, names an unknown task or chains
 * incompatible tasks.
 */
ProcessingPipeline ProcessingPipeline::from_json(const json& pipeline_json, const TaskFactory& factory) {
    ProcessingPipeline pipeline;
    try {
        for (const auto& task_json : pipeline_json.at("tasks")) {
            auto task = deserialize_task(task_json, factory);
            const std::string name = task->display_name();
            if (!pipeline.append(std::move(task))) {
                throw std::runtime_error("Task " + name + " cannot be placed at position " + std::to_string(pipeline.size()));
            }
        }
    } catch (json::exception& e) {
        throw std::runtime_error(std::string("Malformed pipeline description: ") + e.what());
    }
    return pipeline;
}

void ProcessingPipeline::save_to_file(const std::string& filename) const {
    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    out_file << to_json().dump(4);
    out_file.close();
}

ProcessingPipeline ProcessingPipeline::load_from_file(const std::string& filename, const TaskFactory& factory) {
    std::ifstream in_file(filename);
    if (!in_file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    json pipeline_json;
    try {
        pipeline_json = json::parse(in_file);
    } catch (json::parse_error& e) {
        throw std::runtime_error("Cannot parse pipeline file " + filename + ": " + e.what());
    }
    return from_json(pipeline_json, factory);
}

void ProcessingPipeline::save_task_settings(const std::string& settings_directory) const {
    for (const auto& task : tasks) {
        task->save_to_file(settings_directory);
    }
}

size_t ProcessingPipeline::load_task_settings(const std::string& settings_directory) {
    size_t loaded = 0;
    for (auto& task : tasks) {
        if (task->load_from_file(settings_directory)) {
            loaded++;
        }
    }
    return loaded;
}

}  // namespace sardauscan
