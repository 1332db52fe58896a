#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::concurrency;
using namespace cs::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

// Subclasses must call stop() in their own destructor; runLoop() is pure here.
AsyncService::~AsyncService() {
    if (worker_.joinable()) {
        {
            std::scoped_lock lock(sleepMutex_);
            interruptFlag_.store(true, std::memory_order_release);
        }
        sleepCv_.notify_all();
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::cosync()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::cosync()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::cosync()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    LogRegistry::cosync()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
}
