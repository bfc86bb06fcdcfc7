#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <tbb/task_arena.h>

using TaskHandle = uint64_t;

enum class TaskState
{
    RUNNING,
    DONE,
    FAILED
};

/**
 * @brief Background execution of job bodies
 */
class TaskQueue
{
public:
    virtual ~TaskQueue() = default;

    virtual TaskHandle enqueue(std::function<void()> task) = 0;

    /**
     * @brief State of a task; pending tasks report RUNNING
     * @throws std::out_of_range for an unknown or expired handle
     */
    virtual TaskState poll(TaskHandle handle) const = 0;

    /**
     * @brief Block until every enqueued task has finished
     */
    virtual void waitForAll() = 0;
};

/**
 * @brief TaskQueue on a oneTBB arena with a fixed number of workers
 *
 * Outcomes of finished tasks are kept for the most recent retained_results
 * tasks only; older handles expire.
 */
class ThreadPoolTaskQueue : public TaskQueue
{
public:
    /**
     * @param worker_threads Valid range [1-64]; out-of-range values fall back to 4
     * @param retained_results Finished outcomes kept for poll()
     */
    explicit ThreadPoolTaskQueue(size_t worker_threads, size_t retained_results = 1024);
    ~ThreadPoolTaskQueue() override;

    ThreadPoolTaskQueue(const ThreadPoolTaskQueue &) = delete;
    ThreadPoolTaskQueue &operator=(const ThreadPoolTaskQueue &) = delete;

    TaskHandle enqueue(std::function<void()> task) override;
    TaskState poll(TaskHandle handle) const override;
    void waitForAll() override;

    size_t getWorkerCount() const { return worker_count_; }
    size_t getPendingCount() const;
    size_t getTrackedCount() const;

    static bool validateThreadCount(size_t thread_count);

private:
    void finishTask(TaskHandle handle, TaskState state);

    size_t worker_count_;
    tbb::task_arena arena_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<TaskHandle, TaskState> states_;
    std::deque<TaskHandle> finished_; // Oldest first
    size_t retained_results_;
    size_t pending_ = 0;
    std::atomic<TaskHandle> next_handle_{1};
};
