#include "threading.hpp"

namespace tokalign::threading {

ThreadPool::ThreadPool(size_t threads) {
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this]() {
                        return stop.load() || !tasks.empty();
                    });

                    if (stop.load() && tasks.empty()) {
                        return;
                    }

                    // Counted as active before the queue looks empty to wait()
                    task = std::move(tasks.back());
                    tasks.pop_back();
                    active_tasks.fetch_add(1);
                }

                task();
                active_tasks.fetch_sub(1);
            }
        });
    }
}

void ThreadPool::wait() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (tasks.empty() && active_tasks.load() == 0) return;
        }
        std::this_thread::yield();
    }
}

ThreadPool::~ThreadPool() {
    stop.store(true);
    condition.notify_all();
    for (std::thread &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace tokalign::threading
