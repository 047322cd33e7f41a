#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <boost/property_tree/ptree.hpp>

#include "sardauscan/scan_data.hpp"
#include "sardauscan/task/background_worker.hpp"
#include "sardauscan/task/file_dialog.hpp"

namespace sardauscan {

// Category of a task, in palette order
enum class TaskType {
    Input,
    Filter,
    Transform,
    Smooth,
    MeshBuild,
    Color,
    UnknownTask,
    IO
};

// Kind of data consumed or produced by a task
enum class TaskItem {
    None = 0,
    ScanLines = 1,
    Mesh = 2
};

enum class TaskStatus {
    None,
    Working,
    Finished,
    Error
};

std::string to_string(TaskType type);
std::string to_string(TaskItem item);
std::string to_string(TaskStatus status);

/**
 * @brief A typed stage of a processing pipeline.
 *
 * A task consumes data of kind in() and produces data of kind out(). It is run with run(), on the
 * caller's thread or on the host's BackgroundWorker, and reports its progress through an optional
 * callback. Settings are persisted as an XML document whose root element is type_name().
 *
 * Status moves None -> Working -> Finished | Error. prepare_to_run() resets it to None / 0%.
 */
class ProcessingTask {
    public:
        using ProgressCallback = std::function<void(const ProcessingTask& sender, int percent, const ScanDataPtr& data)>;

        ProcessingTask();
        ProcessingTask(const ProcessingTask&) = delete;
        ProcessingTask& operator=(const ProcessingTask&) = delete;
        virtual ~ProcessingTask() = default;

        virtual TaskItem in() const = 0;
        virtual TaskItem out() const = 0;
        virtual TaskType task_type() const;

        // Stable name of the concrete type: factory key, XML root element and settings file stem
        virtual std::string type_name() const = 0;
        virtual std::string name() const = 0;
        virtual std::string display_name() const;
        std::string to_string() const;

        // Fresh default instance of the same concrete type (settings are not copied)
        virtual std::unique_ptr<ProcessingTask> clone() const = 0;

        TaskStatus get_status() const;
        int get_percent() const;
        std::string get_last_error() const;
        virtual std::string tooltip() const;
        virtual bool ready() const;
        // Hidden tasks are not offered in the palette
        virtual bool browsable() const;

        virtual bool has_settings() const;
        // Returns true if the settings were modified
        virtual bool run_settings();

        void prepare_to_run();
        ScanDataPtr run(ScanDataPtr source,
                        FileDialog* control = nullptr,
                        BackgroundWorker* worker = nullptr,
                        WorkerArgs* worker_arg = nullptr,
                        ProgressCallback update_func = nullptr);
        virtual void update_percent(int percent, const ScanDataPtr& data);

        // Pipeline compatibility
        bool can_insert(const ProcessingTask* prev, const ProcessingTask* next) const;
        bool can_insert(TaskItem prev_out, TaskItem next_in) const;
        bool can_follow(TaskItem item) const;
        bool can_follow(const ProcessingTask& other) const;

        // Orders by category, input kind, output kind and display name
        int compare_to(const ProcessingTask& other) const;
        bool operator<(const ProcessingTask& other) const;

        // Settings persistence
        virtual std::string config_file_name() const;
        virtual void write_settings(boost::property_tree::ptree& settings) const;
        virtual void read_settings(const boost::property_tree::ptree& settings);
        std::string to_xml() const;
        bool load_from_xml(const std::string& xml);
        void save_to_file(const std::string& settings_directory) const;
        bool load_from_file(const std::string& settings_directory);

    protected:
        FileDialog* caller_control = nullptr;
        BackgroundWorker* worker = nullptr;
        WorkerArgs* worker_arg = nullptr;

        // Really do the task. May set the status to Error itself, or throw.
        virtual ScanDataPtr do_task(ScanDataPtr source) = 0;

        void set_status(TaskStatus status);
        void set_last_error(const std::string& error);
        bool cancel_pending() const;

    private:
        std::atomic<TaskStatus> status;
        std::atomic<int> percent;
        std::string last_error;
        mutable std::mutex error_padlock;
        ProgressCallback update_func;

        void release_run_context();
};

}  // namespace sardauscan
