#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::concurrency;
using namespace cs::logging;

ThreadPool::ThreadPool(const unsigned int nThreads, std::string name)
    : name_(std::move(name)) {
    const auto n = nThreads == 0 ? 1u : nThreads;
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("[" + name_ + "] submit() after stop()");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;

            // Tasks report their own failures through their promise; anything
            // escaping here is logged so the worker stays alive.
            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::cosync()->error("[{}] Task threw: {}", name_, e.what());
            }
        }
    });
}
