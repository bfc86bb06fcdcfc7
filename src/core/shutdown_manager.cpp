#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <csignal>
#include <utility>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        std::signal(sig, &ShutdownManager::handleSignal);
    }
    startWatcher();
    Logger::info("ShutdownManager: handlers installed for SIGINT, SIGTERM and SIGQUIT");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal received", sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::onShutdown(const std::string &name, ShutdownCallback callback)
{
    NamedCallback entry{name, std::move(callback)};
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_in_progress_.load())
        {
            callbacks_.push_back(std::move(entry));
            return;
        }
    }
    invoke(entry);
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
    }

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) +
                     ", cancelling outstanding work");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }

    runCallbacks();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();
}

void ShutdownManager::runCallbacks() noexcept
{
    std::vector<NamedCallback> pending;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pending.swap(callbacks_);
    }
    for (const auto &entry : pending)
    {
        invoke(entry);
    }
}

void ShutdownManager::invoke(const NamedCallback &entry) noexcept
{
    try
    {
        Logger::debug("ShutdownManager: running '" + entry.name + "'");
        entry.callback();
    }
    catch (const std::exception &e)
    {
        Logger::error("ShutdownManager: callback '" + entry.name + "' failed: " + std::string(e.what()));
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
    callbacks_.clear();
}
