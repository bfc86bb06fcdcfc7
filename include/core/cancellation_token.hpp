#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

/**
 * @brief Raised at a checkpoint once cancellation was requested
 *
 * Not a PipelineError: it is never retried and never recorded as a failure.
 */
class OperationCancelledError : public std::runtime_error
{
public:
    explicit OperationCancelledError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Cooperative cancellation flag shared between a job and its stages
 *
 * Setting the flag never interrupts work in flight; stages and the
 * orchestrator poll it at their checkpoints.
 */
class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @throws OperationCancelledError when cancellation was requested
     */
    void check(const std::string &checkpoint) const
    {
        if (isCancelled())
            throw OperationCancelledError("cancelled at " + checkpoint);
    }

private:
    std::atomic<bool> cancelled_{false};
};
