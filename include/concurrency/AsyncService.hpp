#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace sm::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Called after interruptFlag_ is raised so a sleeping runLoop can notice.
    virtual void wake() {}
};

}
