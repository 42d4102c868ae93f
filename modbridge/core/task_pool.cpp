#include "task_pool.hpp"

#include "logger.hpp"

#include <exception>
#include <string>

namespace modbridge::core {

TaskPool::TaskPool(unsigned threadCount) {
    if (threadCount > 0) {
        log_debug("TaskPool: starting " + std::to_string(threadCount) + " worker threads");
    }
    for (unsigned i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { worker_entry(); });
    }
}

TaskPool::~TaskPool() {
    wait_for_all();

    // Stop accepting work
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        running_ = false;
    }
    wakeCondition_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void TaskPool::dispatch(Task task) {
    if (!task) return;

    if (workers_.empty()) {
        run_task(task);
        return;
    }

    activeTaskCount_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(std::move(task));
    }
    wakeCondition_.notify_one();
}

bool TaskPool::try_run_one() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (queue_.empty()) return false;
        task = std::move(queue_.front());
        queue_.pop_front();
    }

    run_task(task);
    finish_task();
    return true;
}

void TaskPool::run_task(Task& task) {
    // Tasks report their own failures; anything escaping here is a host bug
    // and must not take the worker (and std::terminate) with it.
    try {
        task();
    } catch (const std::exception& e) {
        log_error(std::string("TaskPool: task threw: ") + e.what());
    }
}

void TaskPool::finish_task() {
    if (activeTaskCount_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        std::lock_guard<std::mutex> lock(queueMutex_);
        idleCondition_.notify_all();
    }
}

void TaskPool::wait_for_all() {
    // Help with work while tasks are queued
    while (try_run_one()) {
    }

    // Queue is empty, but workers might still be running tasks.
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return activeTaskCount_.load(std::memory_order_acquire) == 0;
    });
}

void TaskPool::worker_entry() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            wakeCondition_.wait(lock, [this] {
                return !queue_.empty() || !running_;
            });

            if (!running_ && queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
        }

        run_task(task);
        finish_task();
    }
}

} // namespace modbridge::core
