#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/task_queue.hpp"
#include "test_support.hpp"

TEST(TaskQueueTest, ValidateThreadCount)
{
    EXPECT_TRUE(ThreadPoolTaskQueue::validateThreadCount(1));
    EXPECT_TRUE(ThreadPoolTaskQueue::validateThreadCount(4));
    EXPECT_TRUE(ThreadPoolTaskQueue::validateThreadCount(64));
    EXPECT_FALSE(ThreadPoolTaskQueue::validateThreadCount(0));
    EXPECT_FALSE(ThreadPoolTaskQueue::validateThreadCount(65));
}

TEST(TaskQueueTest, InvalidWorkerCountFallsBackToDefault)
{
    ThreadPoolTaskQueue queue(0);
    EXPECT_EQ(queue.getWorkerCount(), 4u);
}

TEST(TaskQueueTest, RunsEnqueuedTasks)
{
    ThreadPoolTaskQueue queue(2);
    std::atomic<int> ran{0};

    std::vector<TaskHandle> handles;
    for (int i = 0; i < 20; ++i)
        handles.push_back(queue.enqueue([&ran]()
                                        { ++ran; }));
    queue.waitForAll();

    EXPECT_EQ(ran.load(), 20);
    EXPECT_EQ(queue.getPendingCount(), 0u);
    for (TaskHandle handle : handles)
        EXPECT_EQ(queue.poll(handle), TaskState::DONE);
}

TEST(TaskQueueTest, HandlesAreUnique)
{
    ThreadPoolTaskQueue queue(1);
    TaskHandle first = queue.enqueue([]() {});
    TaskHandle second = queue.enqueue([]() {});
    EXPECT_NE(first, second);
    queue.waitForAll();
}

TEST(TaskQueueTest, ThrowingTaskIsMarkedFailed)
{
    ThreadPoolTaskQueue queue(1);
    TaskHandle failing = queue.enqueue([]()
                                       { throw std::runtime_error("boom"); });
    TaskHandle fine = queue.enqueue([]() {});
    queue.waitForAll();

    EXPECT_EQ(queue.poll(failing), TaskState::FAILED);
    EXPECT_EQ(queue.poll(fine), TaskState::DONE);
}

TEST(TaskQueueTest, PollReportsRunningTask)
{
    ThreadPoolTaskQueue queue(1);
    auto started = std::make_shared<test_support::Gate>();
    auto release = std::make_shared<test_support::Gate>();

    TaskHandle handle = queue.enqueue([started, release]()
                                      {
        started->open();
        release->waitFor(std::chrono::seconds(10)); });

    ASSERT_TRUE(started->waitFor(std::chrono::seconds(10)));
    EXPECT_EQ(queue.poll(handle), TaskState::RUNNING);
    EXPECT_EQ(queue.getPendingCount(), 1u);

    release->open();
    queue.waitForAll();
    EXPECT_EQ(queue.poll(handle), TaskState::DONE);
}

TEST(TaskQueueTest, UnknownHandleThrows)
{
    ThreadPoolTaskQueue queue(1);
    EXPECT_THROW(queue.poll(12345), std::out_of_range);
}

TEST(TaskQueueTest, OldFinishedOutcomesExpire)
{
    ThreadPoolTaskQueue queue(1, 2);
    std::vector<TaskHandle> handles;
    for (int i = 0; i < 3; ++i)
    {
        handles.push_back(queue.enqueue([]() {}));
        queue.waitForAll();
    }

    EXPECT_EQ(queue.getTrackedCount(), 2u);
    EXPECT_THROW(queue.poll(handles[0]), std::out_of_range);
    EXPECT_EQ(queue.poll(handles[1]), TaskState::DONE);
    EXPECT_EQ(queue.poll(handles[2]), TaskState::DONE);
}

TEST(TaskQueueTest, RunningTasksNeverExpire)
{
    ThreadPoolTaskQueue queue(2, 1);
    auto started = std::make_shared<test_support::Gate>();
    auto release = std::make_shared<test_support::Gate>();
    TaskHandle blocked = queue.enqueue([started, release]()
                                       {
        started->open();
        release->waitFor(std::chrono::seconds(10)); });
    ASSERT_TRUE(started->waitFor(std::chrono::seconds(10)));

    for (int i = 0; i < 3; ++i)
    {
        queue.enqueue([]() {});
        while (queue.getPendingCount() > 1)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(queue.poll(blocked), TaskState::RUNNING);
    EXPECT_EQ(queue.getTrackedCount(), 2u);

    release->open();
    queue.waitForAll();
    EXPECT_EQ(queue.poll(blocked), TaskState::DONE);
    EXPECT_EQ(queue.getTrackedCount(), 1u);
}

TEST(TaskQueueTest, EmptyTaskIsRejected)
{
    ThreadPoolTaskQueue queue(1);
    EXPECT_THROW(queue.enqueue(std::function<void()>()), std::invalid_argument);
}

TEST(TaskQueueTest, DestructorWaitsForOutstandingTasks)
{
    std::atomic<int> ran{0};
    {
        ThreadPoolTaskQueue queue(2);
        for (int i = 0; i < 4; ++i)
        {
            queue.enqueue([&ran]()
                          {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                ++ran; });
        }
    }
    EXPECT_EQ(ran.load(), 4);
}
