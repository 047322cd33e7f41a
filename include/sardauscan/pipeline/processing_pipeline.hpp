#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "sardauscan/task/processing_task.hpp"
#include "sardauscan/task/task_factory.hpp"

namespace sardauscan {

/**
 * @brief Ordered list of processing tasks, each consuming the output of the previous one.
 *
 * Insertion only accepts a task whose input kind matches the previous task's output kind and whose
 * output kind matches the next task's input kind. A task taking no input must be first.
 */
class ProcessingPipeline {
    public:
        bool can_insert(size_t index, const ProcessingTask& task) const;
        // Returns false, and drops the task, if it does not fit at that position
        bool insert(size_t index, std::unique_ptr<ProcessingTask> task);
        bool append(std::unique_ptr<ProcessingTask> task);
        std::unique_ptr<ProcessingTask> remove(size_t index);
        void clear();

        size_t size() const;
        bool empty() const;
        ProcessingTask& at(size_t index);
        const ProcessingTask& at(size_t index) const;
        const std::vector<std::unique_ptr<ProcessingTask>>& get_tasks() const;

        bool is_valid() const;

        /**
         * @brief Run every task in order, feeding each one with the previous result.
         *
         * Stops at the first task ending with TaskStatus::Error, or when the worker has a pending
         * cancellation (WorkerArgs::cancel is then set). Both cases return nullptr.
         */
        ScanDataPtr run(ScanDataPtr source,
                        FileDialog* control = nullptr,
                        BackgroundWorker* worker = nullptr,
                        WorkerArgs* worker_arg = nullptr,
                        ProcessingTask::ProgressCallback update_func = nullptr);

        nlohmann::json to_json() const;
        static ProcessingPipeline from_json(const nlohmann::json& pipeline_json, const TaskFactory& factory);
        void save_to_file(const std::string& filename) const;
        static ProcessingPipeline load_from_file(const std::string& filename, const TaskFactory& factory);

        // Per task XML settings files
        void save_task_settings(const std::string& settings_directory) const;
        size_t load_task_settings(const std::string& settings_directory);

    private:
        std::vector<std::unique_ptr<ProcessingTask>> tasks;

        nlohmann::json serialize_task(const ProcessingTask& task) const;
        static std::unique_ptr<ProcessingTask> deserialize_task(const nlohmann::json& task_json, const TaskFactory& factory);
};

}  // namespace sardauscan
