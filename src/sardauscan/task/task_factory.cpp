#include "sardauscan/task/task_factory.hpp"

#include <algorithm>
#include <stdexcept>

#include "sardauscan/task/load_tasks.hpp"
#include "sardauscan/task/save_tasks.hpp"

namespace sardauscan {

TaskFactory::TaskFactory() {
    register_task<LoadPoints>();
    register_task<LoadMesh>();
    register_task<LoadPcd>();
    register_task<SavePoints>();
    register_task<SaveMesh>();
    register_task<SaveStl>();
    register_task<SavePly>();
    register_task<SaveXyz>();
    register_task<SaveObj>();
}

void TaskFactory::register_task(const std::string& type_name, Creator creator) {
    creators[type_name] = std::move(creator);
}

bool TaskFactory::contains(const std::string& type_name) const {
    return creators.find(type_name) != creators.end();
}

std::unique_ptr<ProcessingTask> TaskFactory::create(const std::string& type_name) const {
    auto it = creators.find(type_name);
    if (it == creators.end()) {
        throw std::invalid_argument("Unknown task type: " + type_name);
    }
    return it->second();
}

std::vector<std::string> TaskFactory::type_names() const {
    std::vector<std::string> names;
    for (const auto& [type_name, creator] : creators) {
        names.push_back(type_name);
    }
    return names;
}

std::vector<std::unique_ptr<ProcessingTask>> TaskFactory::palette() const {
    std::vector<std::unique_ptr<ProcessingTask>> tasks;
    for (const auto& [type_name, creator] : creators) {
        auto task = creator();
        if (task->browsable()) {
            tasks.push_back(std::move(task));
        }
    }

    std::sort(tasks.begin(), tasks.end(),
              [](const auto& a, const auto& b) { return *a < *b; });
    return tasks;
}

std::vector<std::unique_ptr<ProcessingTask>> TaskFactory::candidates_after(TaskItem kind) const {
    auto tasks = palette();
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                               [kind](const auto& task) { return !task->can_follow(kind); }),
                tasks.end());
    return tasks;
}

}  // namespace sardauscan
