#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Reset the ShutdownManager to a clean state before each test
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();
    // Signal handlers stay uninstalled in tests so the runner keeps its own

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
}

TEST_F(ShutdownManagerTest, SignalNumberAndReasonAreRecorded)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("test-signal", SIGTERM);

    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), SIGTERM);
    ASSERT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, TimedWaitReportsOutcome)
{
    auto &mgr = ShutdownManager::getInstance();

    EXPECT_FALSE(mgr.waitForShutdownFor(std::chrono::milliseconds(20)));
    mgr.requestShutdown("unit-test");
    EXPECT_TRUE(mgr.waitForShutdownFor(std::chrono::milliseconds(20)));
}

TEST_F(ShutdownManagerTest, CallbacksRunOnceInRegistrationOrder)
{
    auto &mgr = ShutdownManager::getInstance();
    std::vector<std::string> calls;
    mgr.onShutdown("first", [&calls]()
                   { calls.push_back("first"); });
    mgr.onShutdown("second", [&calls]()
                   { calls.push_back("second"); });

    mgr.requestShutdown("unit-test");
    mgr.requestShutdown("again");

    ASSERT_EQ(calls, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, CallbacksRunBeforeWaitersWake)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<bool> callback_done{false};
    std::atomic<bool> seen_by_waiter{false};
    mgr.onShutdown("slow", [&callback_done]()
                   {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        callback_done.store(true); });

    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        seen_by_waiter.store(callback_done.load()); });

    mgr.requestShutdown("unit-test");
    waiter.join();
    EXPECT_TRUE(seen_by_waiter.load());
}

TEST_F(ShutdownManagerTest, FailingCallbackDoesNotStopOthers)
{
    auto &mgr = ShutdownManager::getInstance();
    bool later_ran = false;
    mgr.onShutdown("broken", []()
                   { throw std::runtime_error("callback failure"); });
    mgr.onShutdown("later", [&later_ran]()
                   { later_ran = true; });

    mgr.requestShutdown("unit-test");

    EXPECT_TRUE(later_ran);
    EXPECT_TRUE(mgr.isShutdownRequested());
}

TEST_F(ShutdownManagerTest, LateRegistrationRunsImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("unit-test");

    bool ran = false;
    mgr.onShutdown("late", [&ran]()
                   { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(ShutdownManagerTest, ResetClearsCallbacks)
{
    auto &mgr = ShutdownManager::getInstance();
    bool ran = false;
    mgr.onShutdown("dropped", [&ran]()
                   { ran = true; });

    mgr.reset();
    mgr.requestShutdown("unit-test");

    EXPECT_FALSE(ran);
}
