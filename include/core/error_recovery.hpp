#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

/**
 * @brief Bounded retry budget for one error kind
 */
struct RetryPolicy
{
    ErrorKind retryable = ErrorKind::TRANSIENT_IO;
    int max_attempts = 1;
    int base_delay_ms = 0; // Exponential backoff base, 0 retries immediately
};

class ErrorRecovery
{
public:
    /**
     * @brief Run func, retrying it while it fails with the policy's error kind
     *
     * Errors of any other kind propagate on the first failure. The final
     * failure is rethrown unchanged once the attempts are exhausted.
     * @param func Callable taking no arguments
     * @param policy Retryable kind, attempt budget and backoff base
     * @param operation_name Name used in log messages
     * @param on_retry Invoked before every retry with the 1-based retry number
     */
    template <typename Func>
    static auto retryWithBackoff(Func func, const RetryPolicy &policy, const std::string &operation_name,
                                 const std::function<void(int)> &on_retry = nullptr)
        -> decltype(func())
    {
        const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
        for (int attempt = 0;; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const PipelineError &e)
            {
                if (e.kind() != policy.retryable)
                    throw;

                if (attempt == max_attempts - 1)
                {
                    Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_attempts) +
                                  " attempts: " + e.what());
                    throw;
                }

                int delay_ms = (1 << attempt) * policy.base_delay_ms; // 100ms, 200ms, 400ms... for a 100ms base
                Logger::warn("Operation '" + operation_name + "' failed, retrying in " + std::to_string(delay_ms) +
                             "ms (attempt " + std::to_string(attempt + 1) + "/" + std::to_string(max_attempts) +
                             "): " + e.what());
                if (on_retry)
                    on_retry(attempt + 1);
                if (delay_ms > 0)
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
    }
};

/**
 * @brief Wall-clock budget of one pipeline stage
 *
 * Long-running loops call check() per item; the orchestrator calls it again
 * after the stage returns so a stage that overran is still failed.
 */
class StageDeadline
{
public:
    StageDeadline(std::string stage_name, double budget_seconds)
        : stage_name_(std::move(stage_name)),
          budget_seconds_(budget_seconds),
          deadline_(std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(budget_seconds)))
    {
    }

    bool expired() const { return std::chrono::steady_clock::now() > deadline_; }

    void check() const
    {
        if (expired())
        {
            throw StageTimeoutError("stage '" + stage_name_ + "' exceeded its " + formatBudget() + "s budget");
        }
    }

    const std::string &stageName() const { return stage_name_; }

private:
    std::string formatBudget() const
    {
        std::string text = std::to_string(budget_seconds_);
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.')
            text.pop_back();
        return text;
    }

    std::string stage_name_;
    double budget_seconds_;
    std::chrono::steady_clock::time_point deadline_;
};
