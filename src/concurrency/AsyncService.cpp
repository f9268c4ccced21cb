#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace sm::concurrency;
using namespace sm::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Subclasses must stop() in their own destructor; by now runLoop() is gone.
    if (worker_.joinable()) {
        interruptFlag_.store(true);
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;

    // A previous loop that died on its own leaves a joinable handle behind
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::syncmon()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::syncmon()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    Registry::syncmon()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);
    wake();

    // Only join if we're not calling stop() from the same thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false);
    interruptFlag_.store(false);

    Registry::syncmon()->info("[{}] Service stopped.", serviceName_);
}
