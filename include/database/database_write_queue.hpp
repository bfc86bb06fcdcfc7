#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

class JobDatabase;

/**
 * @brief Serializes database writes on a single background thread
 */
class DatabaseWriteQueue
{
public:
    using WriteOperation = std::function<void(JobDatabase &)>;

    explicit DatabaseWriteQueue(JobDatabase &database);
    ~DatabaseWriteQueue();

    DatabaseWriteQueue(const DatabaseWriteQueue &) = delete;
    DatabaseWriteQueue &operator=(const DatabaseWriteQueue &) = delete;

    // Enqueue a write operation to be executed by the write thread
    void enqueue(WriteOperation operation);

    // Wait until every enqueued operation has finished executing
    void wait_for_completion();

    // Drain pending operations and stop the write thread
    void stop();

private:
    void write_thread_worker();

    JobDatabase &database_;
    std::queue<WriteOperation> write_queue_;
    size_t in_flight_ = 0;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread write_thread_;
    std::atomic<bool> should_stop_{false};
};
