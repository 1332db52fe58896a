#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace cs::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::string name = "ThreadPool");

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and joins the workers. Running tasks finish first.
    void stop();

    void submit(std::shared_ptr<Task> task);

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace cs::concurrency
