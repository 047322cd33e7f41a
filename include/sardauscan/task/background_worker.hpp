#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>

namespace sardauscan {

// Set by the work item when it stopped because a cancellation was requested
struct WorkerArgs {
    bool cancel = false;
};

/**
 * @brief The single background thread a host may give to a task or a pipeline.
 *
 * Only one work item runs at a time. Cancellation is cooperative: the work item polls
 * cancellation_pending() and reports through WorkerArgs::cancel.
 */
class BackgroundWorker {
    public:
        using WorkFunc = std::function<void(BackgroundWorker&, WorkerArgs&)>;

        BackgroundWorker() = default;
        BackgroundWorker(const BackgroundWorker&) = delete;
        BackgroundWorker& operator=(const BackgroundWorker&) = delete;
        ~BackgroundWorker();

        void run_worker_async(WorkFunc work);
        void cancel_async();
        bool cancellation_pending() const;
        bool is_busy() const;

        // Blocks until the running work item ends; rethrows what escaped from it
        WorkerArgs wait();
    private:
        std::atomic<bool> cancellation{false};
        std::atomic<bool> running{false};
        std::shared_ptr<WorkerArgs> args;
        std::future<void> working;
};

}  // namespace sardauscan
