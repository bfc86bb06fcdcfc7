#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide shutdown coordination for the analysis server.
 * - SIGINT/SIGTERM/SIGQUIT handlers only set sig_atomic_t flags
 * - A watcher thread turns a caught signal into requestShutdown()
 * - Registered callbacks run exactly once, in registration order
 */
class ShutdownManager
{
public:
    using ShutdownCallback = std::function<void()>;

    static ShutdownManager &getInstance();

    void installSignalHandlers();

    /**
     * @brief Register work to run when shutdown is requested
     *
     * Callbacks registered after shutdown was requested run immediately.
     */
    void onShutdown(const std::string &name, ShutdownCallback callback);

    // Safe from any thread except a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    /**
     * @return true if shutdown was requested before the timeout elapsed
     */
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Test isolation: clears state, callbacks and pending signals
    void reset() noexcept;

private:
    struct NamedCallback
    {
        std::string name;
        ShutdownCallback callback;
    };

    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runCallbacks() noexcept;
    static void invoke(const NamedCallback &entry) noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<NamedCallback> callbacks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
