#include "sardauscan/task/background_worker.hpp"

#include <stdexcept>

#include "sardauscan/utils/logging.hpp"

namespace sardauscan {

BackgroundWorker::~BackgroundWorker() {
    if (working.valid()) {
        cancel_async();
        try {
            working.get();
        } catch (std::exception& e) {
            SDS_ERROR("Background work ended with an error: {}", e.what());
        }
    }
}

void BackgroundWorker::run_worker_async(WorkFunc work) {
    if (is_busy()) {
        throw std::logic_error("BackgroundWorker is already running a work item");
    }
    if (working.valid()) {
        try {
            working.get();
        } catch (std::exception& e) {
            SDS_WARN("Previous background work ended with an error: {}", e.what());
        }
    }

    cancellation = false;
    running = true;
    args = std::make_shared<WorkerArgs>();
    working = std::async(std::launch::async, [this, work = std::move(work), args = args] {
        struct RunningGuard {
            std::atomic<bool>& flag;
            ~RunningGuard() { flag = false; }
        } guard{running};
        work(*this, *args);
    });
}

void BackgroundWorker::cancel_async() {
    cancellation = true;
}

bool BackgroundWorker::cancellation_pending() const {
    return cancellation;
}

bool BackgroundWorker::is_busy() const {
    return running;
}

WorkerArgs BackgroundWorker::wait() {
    if (!working.valid()) {
        return args ? *args : WorkerArgs{};
    }
    working.get();
    return *args;
}

}  // namespace sardauscan
