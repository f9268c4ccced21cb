#include "concurrency/ThreadWorker.hpp"
#include "log/Registry.hpp"

using namespace sm::concurrency;

ThreadWorker::ThreadWorker(std::string name) : name_(std::move(name)) {
    thread_ = std::thread([this] { run(); });
}

ThreadWorker::~ThreadWorker() {
    stop();
}

void ThreadWorker::enqueue(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex_);
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void ThreadWorker::stop() {
    {
        std::scoped_lock lock(mutex_);
        stopFlag_.store(true, std::memory_order_relaxed);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue_, empty);
    }
    cv_.notify_all();

    // Only join if we're not calling stop() from the worker itself
    if (thread_.joinable() && !onWorkerThread()) thread_.join();
}

void ThreadWorker::run() {
    while (true) {
        std::shared_ptr<Task> task;

        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] {
                return stopFlag_.load() || !queue_.empty();
            });
            if (stopFlag_.load() && queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop();
        }

        if (task) {
            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::syncmon()->error("[{}] Task escaped with exception: {}", name_, e.what());
            }
        }
    }
}
