#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "sardauscan/task/background_worker.hpp"

using namespace sardauscan;

TEST(BackgroundWorker, test_runs_work_item_on_other_thread) {
    BackgroundWorker worker;
    std::thread::id work_thread;

    worker.run_worker_async([&](BackgroundWorker&, WorkerArgs&) { work_thread = std::this_thread::get_id(); });
    worker.wait();

    EXPECT_NE(work_thread, std::this_thread::get_id());
    EXPECT_FALSE(worker.is_busy());
}

TEST(BackgroundWorker, test_cooperative_cancellation) {
    // Arrange
    BackgroundWorker worker;
    std::atomic<bool> started{false};
    worker.run_worker_async([&](BackgroundWorker& self, WorkerArgs& args) {
        started = true;
        while (!self.cancellation_pending()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        args.cancel = true;
    });
    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // Act
    EXPECT_TRUE(worker.is_busy());
    worker.cancel_async();
    WorkerArgs result = worker.wait();

    // Assert
    EXPECT_TRUE(result.cancel);
    EXPECT_FALSE(worker.is_busy());
}

TEST(BackgroundWorker, test_second_item_while_busy_throws) {
    BackgroundWorker worker;
    std::atomic<bool> release{false};
    worker.run_worker_async([&](BackgroundWorker&, WorkerArgs&) {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    EXPECT_THROW(worker.run_worker_async([](BackgroundWorker&, WorkerArgs&) {}), std::logic_error);

    release = true;
    worker.wait();
}

TEST(BackgroundWorker, test_wait_rethrows_work_error) {
    BackgroundWorker worker;

    worker.run_worker_async([](BackgroundWorker&, WorkerArgs&) { throw std::runtime_error("boom"); });

    EXPECT_THROW(worker.wait(), std::runtime_error);
}

TEST(BackgroundWorker, test_new_item_resets_cancellation) {
    BackgroundWorker worker;
    worker.cancel_async();
    ASSERT_TRUE(worker.cancellation_pending());
    bool pending_inside = true;

    worker.run_worker_async([&](BackgroundWorker& self, WorkerArgs&) { pending_inside = self.cancellation_pending(); });
    WorkerArgs result = worker.wait();

    EXPECT_FALSE(pending_inside);
    EXPECT_FALSE(result.cancel);
}
