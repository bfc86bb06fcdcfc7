#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/analysis_types.hpp"
#include "core/cancellation_token.hpp"

/**
 * @brief Mutable state of one job, guarded by its own lock
 *
 * The pipeline body is the only writer of stage transitions. cancel() takes
 * the exclusive lock only to inspect the status and set the token.
 */
struct JobRecord
{
    VideoJob job;
    int retry_count = 0;
    std::optional<AnalysisResult> result;
    std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>();
    mutable std::shared_mutex mutex;
};

class JobStore
{
public:
    /**
     * @brief Register a new job
     * @throws std::invalid_argument when the id is already taken
     */
    std::shared_ptr<JobRecord> create(const VideoJob &job);

    /**
     * @brief Register a job with its stored result and retry count (restore path)
     */
    std::shared_ptr<JobRecord> restore(const VideoJob &job, int retry_count, std::optional<AnalysisResult> result);

    std::shared_ptr<JobRecord> find(const std::string &job_id) const;

    bool contains(const std::string &job_id) const;

    /**
     * @brief Consistent status snapshot, std::nullopt for unknown ids
     */
    std::optional<JobStatusReport> snapshot(const std::string &job_id) const;

    std::optional<VideoJob> jobSnapshot(const std::string &job_id) const;

    std::vector<std::string> jobIds() const;

    size_t size() const;

private:
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobRecord>> records_;
};
