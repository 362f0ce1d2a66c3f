#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tokalign::threading {

// Fixed set of worker threads draining a shared task list
class ThreadPool {
  private:
    std::vector<std::thread> workers;
    std::vector<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<size_t> active_tasks{0};
    std::atomic<bool> stop{false};

  public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    // Tasks must not throw; wrap the body and hand errors back to the caller
    template <typename F> void enqueue(F &&f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace_back(std::forward<F>(f));
        }
        condition.notify_one();
    }

    // Blocks until the task list is empty and no task is running
    void wait();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
};

} // namespace tokalign::threading
