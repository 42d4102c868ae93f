#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace modbridge::core {

// Fixed-size worker pool used to run guest calls of one phase in parallel.
//
// dispatch() queues a task, wait_for_all() blocks until every dispatched task
// has finished; the waiting thread helps draining the queue meanwhile.
// With zero workers, tasks run inline inside dispatch().
class TaskPool {
public:
    using Task = std::function<void()>;

    explicit TaskPool(unsigned threadCount = 0);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    void dispatch(Task task);
    void wait_for_all();

    unsigned worker_count() const { return static_cast<unsigned>(workers_.size()); }

private:
    void worker_entry();
    bool try_run_one();
    void run_task(Task& task);
    void finish_task();

    std::vector<std::thread> workers_;
    std::deque<Task> queue_;

    std::mutex queueMutex_;
    std::condition_variable wakeCondition_;   // wakes sleeping workers
    std::condition_variable idleCondition_;   // wakes wait_for_all()

    bool running_{true};
    std::atomic<int> activeTaskCount_{0};
};

} // namespace modbridge::core
