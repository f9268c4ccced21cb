#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace sm::concurrency {

// One dedicated thread draining a FIFO of tasks. Every run of the daemon
// executes here, so at most one task body is ever active.
class ThreadWorker {
public:
    explicit ThreadWorker(std::string name);

    ~ThreadWorker();

    ThreadWorker(const ThreadWorker&) = delete;
    ThreadWorker& operator=(const ThreadWorker&) = delete;

    void enqueue(std::shared_ptr<Task> task);

    // Drains nothing further; waits for the task in flight to return.
    void stop();

private:
    void run();
    [[nodiscard]] bool onWorkerThread() const { return std::this_thread::get_id() == thread_.get_id(); }

    std::string name_;
    std::atomic<bool> stopFlag_{false};
    std::queue<std::shared_ptr<Task>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

}
