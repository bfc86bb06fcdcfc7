#include "database/database_write_queue.hpp"
#include "logging/logger.hpp"

DatabaseWriteQueue::DatabaseWriteQueue(JobDatabase &database)
    : database_(database)
{
    write_thread_ = std::thread(&DatabaseWriteQueue::write_thread_worker, this);
}

DatabaseWriteQueue::~DatabaseWriteQueue()
{
    stop();
}

void DatabaseWriteQueue::enqueue(WriteOperation operation)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (should_stop_)
        {
            Logger::warn("Database write queue is stopped, dropping write operation");
            return;
        }
        write_queue_.push(std::move(operation));
    }
    queue_cv_.notify_one();
}

void DatabaseWriteQueue::wait_for_completion()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
                  { return write_queue_.empty() && in_flight_ == 0; });
}

void DatabaseWriteQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
    if (write_thread_.joinable())
    {
        write_thread_.join();
    }
}

void DatabaseWriteQueue::write_thread_worker()
{
    while (true)
    {
        WriteOperation operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !write_queue_.empty() || should_stop_; });

            // Pending writes are drained before the thread exits
            if (write_queue_.empty())
            {
                break;
            }

            operation = std::move(write_queue_.front());
            write_queue_.pop();
            ++in_flight_;
        }

        try
        {
            operation(database_);
        }
        catch (const std::exception &e)
        {
            Logger::error("Database write operation failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}
