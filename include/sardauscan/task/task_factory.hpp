#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sardauscan/task/processing_task.hpp"

namespace sardauscan {

class TaskFactory {
    public:
        using Creator = std::function<std::unique_ptr<ProcessingTask>()>;

        // Registers every built-in task
        TaskFactory();

        template <typename TaskT>
        void register_task() {
            register_task(TaskT().type_name(), [] { return std::make_unique<TaskT>(); });
        }
        void register_task(const std::string& type_name, Creator creator);

        bool contains(const std::string& type_name) const;
        std::unique_ptr<ProcessingTask> create(const std::string& type_name) const;
        std::vector<std::string> type_names() const;

        // One instance of every browsable task, sorted by category, data kinds and name
        std::vector<std::unique_ptr<ProcessingTask>> palette() const;
        std::vector<std::unique_ptr<ProcessingTask>> candidates_after(TaskItem kind) const;
    private:
        std::map<std::string, Creator> creators;
};

}  // namespace sardauscan
