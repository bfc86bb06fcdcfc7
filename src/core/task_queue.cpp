#include "core/task_queue.hpp"
#include <stdexcept>
#include <utility>
#include "logging/logger.hpp"

namespace
{
    size_t effectiveWorkerCount(size_t requested)
    {
        if (ThreadPoolTaskQueue::validateThreadCount(requested))
            return requested;
        Logger::error("Invalid worker thread count: " + std::to_string(requested) + ". Using default: 4");
        return 4;
    }
}

ThreadPoolTaskQueue::ThreadPoolTaskQueue(size_t worker_threads, size_t retained_results)
    : worker_count_(effectiveWorkerCount(worker_threads)),
      arena_(static_cast<int>(worker_count_), 0),
      retained_results_(retained_results)
{
    arena_.initialize();
    Logger::info("Task queue initialized with " + std::to_string(worker_count_) + " worker threads");
}

ThreadPoolTaskQueue::~ThreadPoolTaskQueue()
{
    waitForAll();
    arena_.terminate();
    Logger::debug("Task queue shut down");
}

TaskHandle ThreadPoolTaskQueue::enqueue(std::function<void()> task)
{
    if (!task)
        throw std::invalid_argument("cannot enqueue an empty task");

    const TaskHandle handle = next_handle_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        states_[handle] = TaskState::RUNNING;
        ++pending_;
    }

    arena_.enqueue([this, handle, task = std::move(task)]()
                   {
        TaskState outcome = TaskState::DONE;
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            Logger::error("Task " + std::to_string(handle) + " failed: " + std::string(e.what()));
            outcome = TaskState::FAILED;
        }
        catch (...)
        {
            Logger::error("Task " + std::to_string(handle) + " failed with a non-standard exception");
            outcome = TaskState::FAILED;
        }
        finishTask(handle, outcome); });

    return handle;
}

void ThreadPoolTaskQueue::finishTask(TaskHandle handle, TaskState state)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        states_[handle] = state;
        finished_.push_back(handle);
        while (finished_.size() > retained_results_)
        {
            states_.erase(finished_.front());
            finished_.pop_front();
        }
        --pending_;
    }
    idle_cv_.notify_all();
}

TaskState ThreadPoolTaskQueue::poll(TaskHandle handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(handle);
    if (it == states_.end())
        throw std::out_of_range("unknown task handle " + std::to_string(handle));
    return it->second;
}

void ThreadPoolTaskQueue::waitForAll()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]
                  { return pending_ == 0; });
}

size_t ThreadPoolTaskQueue::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

size_t ThreadPoolTaskQueue::getTrackedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

bool ThreadPoolTaskQueue::validateThreadCount(size_t thread_count)
{
    // Minimum: 1 worker, maximum: 64
    if (thread_count < 1 || thread_count > 64)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) + " is outside valid range [1-64]");
        return false;
    }
    return true;
}
