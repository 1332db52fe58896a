#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace cs::concurrency {

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

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for `d` or until stop() is called, whichever comes first
    void lazySleep(std::chrono::milliseconds d);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
