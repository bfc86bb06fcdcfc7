#include "core/job_store.hpp"
#include <mutex>
#include <stdexcept>
#include <utility>

std::shared_ptr<JobRecord> JobStore::create(const VideoJob &job)
{
    auto record = std::make_shared<JobRecord>();
    record->job = job;

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    if (!records_.emplace(job.job_id, record).second)
        throw std::invalid_argument("duplicate job id " + job.job_id);
    return record;
}

std::shared_ptr<JobRecord> JobStore::restore(const VideoJob &job, int retry_count,
                                             std::optional<AnalysisResult> result)
{
    auto record = std::make_shared<JobRecord>();
    record->job = job;
    record->retry_count = retry_count;
    record->result = std::move(result);

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    records_[job.job_id] = record;
    return record;
}

std::shared_ptr<JobRecord> JobStore::find(const std::string &job_id) const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = records_.find(job_id);
    return it == records_.end() ? nullptr : it->second;
}

bool JobStore::contains(const std::string &job_id) const
{
    return find(job_id) != nullptr;
}

std::optional<JobStatusReport> JobStore::snapshot(const std::string &job_id) const
{
    auto record = find(job_id);
    if (!record)
        return std::nullopt;

    std::shared_lock<std::shared_mutex> lock(record->mutex);
    JobStatusReport report;
    report.status = record->job.status;
    report.progress = record->job.progress;
    report.error_message = record->job.error_message;
    report.retry_count = record->retry_count;
    return report;
}

std::optional<VideoJob> JobStore::jobSnapshot(const std::string &job_id) const
{
    auto record = find(job_id);
    if (!record)
        return std::nullopt;
    std::shared_lock<std::shared_mutex> lock(record->mutex);
    return record->job;
}

std::vector<std::string> JobStore::jobIds() const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto &entry : records_)
        ids.push_back(entry.first);
    return ids;
}

size_t JobStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return records_.size();
}
