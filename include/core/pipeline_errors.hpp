#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy of the analysis pipeline
 *
 * Every stage failure is classified into one of these kinds at the orchestrator
 * boundary and recorded as "<KindName>: <message>" on the job.
 */
enum class ErrorKind
{
    VALIDATION,
    DECODE,
    EMPTY_VIDEO,
    TRANSIENT_IO,
    INFERENCE,
    RENDER,
    TIMEOUT,
    INTERNAL
};

class ErrorKinds
{
public:
    static std::string getKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::VALIDATION:
            return "ValidationError";
        case ErrorKind::DECODE:
            return "DecodeError";
        case ErrorKind::EMPTY_VIDEO:
            return "EmptyVideoError";
        case ErrorKind::TRANSIENT_IO:
            return "TransientIOError";
        case ErrorKind::INFERENCE:
            return "InferenceError";
        case ErrorKind::RENDER:
            return "RenderError";
        case ErrorKind::TIMEOUT:
            return "TimeoutError";
        case ErrorKind::INTERNAL:
        default:
            return "InternalError";
        }
    }
};

class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief Message in the form stored on a failed job
     */
    std::string describe() const { return ErrorKinds::getKindName(kind_) + ": " + what(); }

private:
    ErrorKind kind_;
};

// Malformed or oversized input, raised by submit before a job exists
class ValidationError : public PipelineError
{
public:
    explicit ValidationError(const std::string &message) : PipelineError(ErrorKind::VALIDATION, message) {}
};

class DecodeError : public PipelineError
{
public:
    explicit DecodeError(const std::string &message) : PipelineError(ErrorKind::DECODE, message) {}
};

class EmptyVideoError : public PipelineError
{
public:
    explicit EmptyVideoError(const std::string &message) : PipelineError(ErrorKind::EMPTY_VIDEO, message) {}
};

// Storage or network hiccup; retried with backoff
class TransientIOError : public PipelineError
{
public:
    explicit TransientIOError(const std::string &message) : PipelineError(ErrorKind::TRANSIENT_IO, message) {}
};

// Model output is malformed; deterministic, never retried
class InferenceError : public PipelineError
{
public:
    explicit InferenceError(const std::string &message) : PipelineError(ErrorKind::INFERENCE, message) {}
};

class RenderError : public PipelineError
{
public:
    explicit RenderError(const std::string &message) : PipelineError(ErrorKind::RENDER, message) {}
};

class StageTimeoutError : public PipelineError
{
public:
    explicit StageTimeoutError(const std::string &message) : PipelineError(ErrorKind::TIMEOUT, message) {}
};

class InternalError : public PipelineError
{
public:
    explicit InternalError(const std::string &message) : PipelineError(ErrorKind::INTERNAL, message) {}
};
