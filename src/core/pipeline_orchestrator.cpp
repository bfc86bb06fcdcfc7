#include "core/pipeline_orchestrator.hpp"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <tbb/task_group.h>
#include "core/cancellation_token.hpp"
#include "core/json_serialization.hpp"
#include "core/pipeline_errors.hpp"
#include "core/pose_assembler.hpp"
#include "database/job_database.hpp"
#include "logging/logger.hpp"

using json = nlohmann::json;

namespace
{
    const char *kInterruptedMessage = "InternalError: interrupted by server restart";

    PipelineComponents requireComplete(PipelineComponents components)
    {
        if (!components.sampler || !components.estimator || !components.trick_model || !components.encoder ||
            !components.store || !components.queue || !components.notifier)
        {
            throw std::invalid_argument("PipelineOrchestrator requires sampler, estimator, trick model, encoder, "
                                        "store, queue and notifier");
        }
        return components;
    }

    std::string describeFailure(const std::exception_ptr &error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const PipelineError &e)
        {
            return e.describe();
        }
        catch (const std::exception &e)
        {
            return ErrorKinds::getKindName(ErrorKind::INTERNAL) + ": " + e.what();
        }
        catch (...)
        {
            return ErrorKinds::getKindName(ErrorKind::INTERNAL) + ": unknown error";
        }
    }
}

PipelineOrchestrator::PipelineOrchestrator(const AnalysisConfig &config, PipelineComponents components)
    : config_(config),
      components_(requireComplete(std::move(components))),
      segmenter_(components_.trick_model, config_.segmentation),
      scorer_(config_.scoring),
      renderer_(components_.encoder, config_.rendering)
{
    if (!config_.resolveStyle("default"))
        throw std::invalid_argument("configuration has no 'default' style");
}

PipelineOrchestrator::~PipelineOrchestrator()
{
    // Job bodies hold a pointer to this orchestrator
    waitForIdle();
}

std::string PipelineOrchestrator::artifactPrefix(const std::string &job_id)
{
    return "jobs/" + job_id + "/";
}

std::string PipelineOrchestrator::generateJobId() const
{
    static thread_local std::mt19937_64 engine(std::random_device{}());
    for (;;)
    {
        std::stringstream ss;
        ss << "job-" << std::hex << std::setw(16) << std::setfill('0') << engine();
        std::string id = ss.str();
        if (!jobs_.contains(id))
            return id;
    }
}

RetryPolicy PipelineOrchestrator::transientPolicy() const
{
    return RetryPolicy{ErrorKind::TRANSIENT_IO, config_.retry.transient_attempts,
                       config_.retry.transient_base_delay_ms};
}

RetryPolicy PipelineOrchestrator::renderPolicy() const
{
    return RetryPolicy{ErrorKind::RENDER, config_.retry.render_attempts, 0};
}

std::function<void(int)> PipelineOrchestrator::retryCounter(const std::shared_ptr<JobRecord> &record) const
{
    return [record](int)
    {
        std::unique_lock<std::shared_mutex> lock(record->mutex);
        ++record->retry_count;
    };
}

std::string PipelineOrchestrator::submit(const std::string &video_ref, const std::string &user_id,
                                         const std::string &style)
{
    if (video_ref.empty())
        throw ValidationError("video reference must not be empty");
    if (user_id.empty())
        throw ValidationError("user id must not be empty");

    std::optional<StyleProfile> profile = config_.resolveStyle(style);
    if (!profile)
        throw ValidationError("unknown style '" + style + "'");

    if (!components_.store->exists(video_ref))
        throw ValidationError("video '" + video_ref + "' does not exist");

    uint64_t video_size = 0;
    try
    {
        video_size = components_.store->size(video_ref);
    }
    catch (const TransientIOError &e)
    {
        throw ValidationError("video '" + video_ref + "' is not readable: " + e.what());
    }
    const uint64_t max_bytes = static_cast<uint64_t>(config_.storage.max_video_size_mb) * 1024 * 1024;
    if (video_size == 0)
        throw ValidationError("video '" + video_ref + "' is empty");
    if (video_size > max_bytes)
        throw ValidationError("video is " + std::to_string(video_size) + " bytes, limit is " +
                              std::to_string(config_.storage.max_video_size_mb) + " MB");

    VideoJob job;
    job.job_id = generateJobId();
    job.video_id = video_ref;
    job.user_id = user_id;
    job.style = profile->name;
    job.status = JobStatus::QUEUED;
    job.progress = 0;
    job.created_at = std::chrono::system_clock::now();
    job.updated_at = job.created_at;

    auto record = jobs_.create(job);
    persistJob(record);
    Logger::info("Job " + job.job_id + " queued for video " + video_ref + " (user " + user_id + ", style " +
                 profile->name + ")");

    StyleProfile resolved = *profile;
    components_.queue->enqueue([this, record, resolved]()
                               { runPipeline(record, resolved); });
    return job.job_id;
}

std::optional<JobStatusReport> PipelineOrchestrator::getStatus(const std::string &job_id) const
{
    return jobs_.snapshot(job_id);
}

std::optional<AnalysisResult> PipelineOrchestrator::getResult(const std::string &job_id) const
{
    auto record = jobs_.find(job_id);
    if (!record)
        return std::nullopt;
    std::shared_lock<std::shared_mutex> lock(record->mutex);
    if (record->job.status != JobStatus::COMPLETED)
        return std::nullopt;
    return record->result;
}

bool PipelineOrchestrator::cancel(const std::string &job_id)
{
    auto record = jobs_.find(job_id);
    if (!record)
        return false;

    std::unique_lock<std::shared_mutex> lock(record->mutex);
    if (JobStatuses::isTerminal(record->job.status))
        return false;
    record->token->cancel();
    Logger::info("Cancellation requested for job " + job_id + " in stage " +
                 JobStatuses::getStatusName(record->job.status));
    return true;
}

size_t PipelineOrchestrator::cancelAll()
{
    size_t cancelled = 0;
    for (const auto &job_id : jobs_.jobIds())
    {
        if (cancel(job_id))
            ++cancelled;
    }
    return cancelled;
}

std::optional<ArtifactUrls> PipelineOrchestrator::presignArtifacts(const std::string &job_id) const
{
    std::optional<AnalysisResult> result = getResult(job_id);
    if (!result)
        return std::nullopt;
    ArtifactUrls urls;
    urls.animation_url = components_.store->presign(result->animation_artifact_ref);
    urls.highlight_url = components_.store->presign(result->highlight_artifact_ref);
    return urls;
}

void PipelineOrchestrator::waitForIdle()
{
    components_.queue->waitForAll();
    if (components_.database)
        components_.database->waitForWrites();
}

std::vector<std::string> PipelineOrchestrator::jobIds() const
{
    return jobs_.jobIds();
}

size_t PipelineOrchestrator::restoreFromDatabase()
{
    if (!components_.database)
        return 0;

    std::unordered_map<std::string, AnalysisResult> results;
    for (auto &result : components_.database->loadResults())
        results.emplace(result.job_id, std::move(result));

    size_t restored = 0;
    for (auto &stored : components_.database->loadJobs())
    {
        VideoJob &job = stored.job;
        if (jobs_.contains(job.job_id))
            continue;

        std::optional<AnalysisResult> result;
        auto found = results.find(job.job_id);
        if (job.status == JobStatus::COMPLETED && found != results.end())
            result = found->second;

        bool interrupted = !JobStatuses::isTerminal(job.status) ||
                           (job.status == JobStatus::COMPLETED && !result);
        if (interrupted)
        {
            Logger::warn("Job " + job.job_id + " was " + JobStatuses::getStatusName(job.status) +
                         " when the server stopped, marking it failed");
            job.status = JobStatus::FAILED;
            job.error_message = kInterruptedMessage;
            job.updated_at = std::chrono::system_clock::now();
            result.reset();
        }

        auto record = jobs_.restore(job, stored.retry_count, std::move(result));
        if (interrupted)
        {
            persistJob(record);
            removeArtifacts(job.job_id);
        }
        ++restored;
    }
    Logger::info("Restored " + std::to_string(restored) + " jobs from the database");
    return restored;
}

bool PipelineOrchestrator::enterStage(const std::shared_ptr<JobRecord> &record, JobStatus stage, JobStatus previous)
{
    {
        std::unique_lock<std::shared_mutex> lock(record->mutex);
        if (!record->token->isCancelled())
        {
            record->job.status = stage;
            record->job.progress = std::max(record->job.progress, JobStatuses::progressAfter(previous));
            record->job.updated_at = std::chrono::system_clock::now();
        }
    }
    if (record->token->isCancelled())
    {
        finishCancelled(record);
        return false;
    }
    Logger::info("Job " + record->job.job_id + " entered stage " + JobStatuses::getStatusName(stage));
    persistJob(record);
    return true;
}

void PipelineOrchestrator::runPipeline(const std::shared_ptr<JobRecord> &record, const StyleProfile &style)
{
    std::string video_ref;
    {
        std::shared_lock<std::shared_mutex> lock(record->mutex);
        video_ref = record->job.video_id;
    }

    try
    {
        if (!enterStage(record, JobStatus::EXTRACTING, JobStatus::QUEUED))
            return;
        OpenedVideo video = openVideo(record, video_ref);

        if (!enterStage(record, JobStatus::ESTIMATING_POSE, JobStatus::EXTRACTING))
            return;
        auto series = std::make_shared<const std::vector<PoseFrame>>(estimatePoses(record, std::move(video)));

        if (!enterStage(record, JobStatus::CLASSIFYING, JobStatus::ESTIMATING_POSE))
            return;
        auto segments = std::make_shared<const std::vector<TrickSegment>>(classify(record, *series, style));

        if (!enterStage(record, JobStatus::SCORING_RENDERING, JobStatus::CLASSIFYING))
            return;
        AnalysisResult result = scoreAndRender(record, series, segments, style);

        commitResult(record, std::move(result));
    }
    catch (const OperationCancelledError &e)
    {
        Logger::info("Job " + record->job.job_id + " stopped: " + std::string(e.what()));
        finishCancelled(record);
    }
    catch (...)
    {
        finishFailed(record, describeFailure(std::current_exception()));
    }
}

PipelineOrchestrator::OpenedVideo PipelineOrchestrator::openVideo(const std::shared_ptr<JobRecord> &record,
                                                                  const std::string &video_ref)
{
    StageDeadline deadline("extracting", config_.timeouts.extracting_seconds);

    auto bytes = ErrorRecovery::retryWithBackoff(
        [&]()
        { return components_.store->get(video_ref); },
        transientPolicy(), "fetch video " + video_ref, retryCounter(record));
    record->token->check("video fetch");

    OpenedVideo video;
    video.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    video.frames = components_.sampler->sample(video.bytes, config_.sampling.target_fps);
    video.first = video.frames->next();
    if (!video.first)
        throw EmptyVideoError("video produced no frames");
    deadline.check();

    Logger::info("Job " + record->job.job_id + " opened video " + video_ref + " (" +
                 std::to_string(video.bytes->size()) + " bytes)");
    return video;
}

std::vector<PoseFrame> PipelineOrchestrator::estimatePoses(const std::shared_ptr<JobRecord> &record,
                                                           OpenedVideo video)
{
    StageDeadline deadline("estimating_pose", config_.timeouts.estimating_pose_seconds);

    std::vector<PoseEstimate> estimates;
    std::optional<SampledFrame> frame = std::move(video.first);
    while (frame)
    {
        record->token->check("pose estimation of frame " + std::to_string(frame->frame_index));
        estimates.push_back(components_.estimator->estimate(*frame));
        frame.reset();
        deadline.check();
        frame = video.frames->next();
    }
    video.frames.reset();
    video.bytes.reset();

    std::vector<PoseFrame> series = PoseAssembler::assemble(estimates, config_.pose.joint_count);
    const std::string job_id = record->job.job_id;
    storeArtifact(record, artifactPrefix(job_id) + "poses.json", toArtifactBytes(json(series)));
    deadline.check();

    Logger::info("Job " + job_id + " assembled " + std::to_string(series.size()) + " poses (" +
                 std::to_string(PoseAssembler::countInterpolated(series)) + " interpolated)");
    return series;
}

std::vector<TrickSegment> PipelineOrchestrator::classify(const std::shared_ptr<JobRecord> &record,
                                                         const std::vector<PoseFrame> &series,
                                                         const StyleProfile &style)
{
    StageDeadline deadline("classifying", config_.timeouts.classifying_seconds);

    std::vector<TrickSegment> segments = segmenter_.segment(series, style);
    deadline.check();

    const std::string job_id = record->job.job_id;
    storeArtifact(record, artifactPrefix(job_id) + "segments.json", toArtifactBytes(json(segments)));
    deadline.check();

    Logger::info("Job " + job_id + " found " + std::to_string(segments.size()) + " trick segments");
    return segments;
}

AnalysisResult PipelineOrchestrator::scoreAndRender(const std::shared_ptr<JobRecord> &record,
                                                    std::shared_ptr<const std::vector<PoseFrame>> series,
                                                    std::shared_ptr<const std::vector<TrickSegment>> segments,
                                                    const StyleProfile &style)
{
    const std::string job_id = record->job.job_id;

    ScoreCard card;
    std::string animation_ref;
    std::string highlight_ref;
    std::exception_ptr scoring_error;
    std::exception_ptr rendering_error;

    tbb::task_group branches;
    branches.run([&, series, segments]()
                 {
        try
        {
            StageDeadline deadline("scoring", config_.timeouts.scoring_seconds);
            card = scorer_.score(*series, *segments, style);
            deadline.check();
            record->token->check("scoring");
        }
        catch (...)
        {
            scoring_error = std::current_exception();
        } });
    branches.run([&, series, segments]()
                 {
        try
        {
            StageDeadline deadline("rendering", config_.timeouts.rendering_seconds);
            RenderedClips clips = ErrorRecovery::retryWithBackoff(
                [&]()
                { return renderer_.render(*series, *segments, style, &deadline, record->token.get()); },
                renderPolicy(), "render job " + job_id, retryCounter(record));
            animation_ref = storeArtifact(record, artifactPrefix(job_id) + "animation.avi", clips.animation);
            highlight_ref = storeArtifact(record, artifactPrefix(job_id) + "highlight.avi", clips.highlight);
            deadline.check();
        }
        catch (...)
        {
            rendering_error = std::current_exception();
        } });
    branches.wait();

    if (scoring_error)
        std::rethrow_exception(scoring_error);
    if (rendering_error)
        std::rethrow_exception(rendering_error);

    AnalysisResult result;
    result.job_id = job_id;
    result.video_id = record->job.video_id;
    result.overall_score = card.overall;
    result.difficulty_score = card.difficulty;
    result.stability_score = card.stability;
    result.segments = *segments;
    result.feedback = card.feedback;
    result.animation_artifact_ref = animation_ref;
    result.highlight_artifact_ref = highlight_ref;
    result.frame_count = series->size();
    result.interpolated_frame_count = PoseAssembler::countInterpolated(*series);
    result.created_at = std::chrono::system_clock::now();
    return result;
}

std::string PipelineOrchestrator::storeArtifact(const std::shared_ptr<JobRecord> &record, const std::string &key,
                                                const std::vector<uint8_t> &bytes)
{
    return ErrorRecovery::retryWithBackoff(
        [&]()
        {
            // Nothing is written for a job once cancellation was requested
            record->token->check("store " + key);
            return components_.store->put(key, bytes);
        },
        transientPolicy(), "store " + key, retryCounter(record));
}

void PipelineOrchestrator::commitResult(const std::shared_ptr<JobRecord> &record, AnalysisResult result)
{
    storeArtifact(record, artifactPrefix(result.job_id) + "result.json", toArtifactBytes(json(result)));

    VideoJob job;
    {
        std::unique_lock<std::shared_mutex> lock(record->mutex);
        if (!record->token->isCancelled())
        {
            record->result = result;
            record->job.status = JobStatus::COMPLETED;
            record->job.progress = JobStatuses::progressAfter(JobStatus::COMPLETED);
            record->job.updated_at = std::chrono::system_clock::now();
        }
        job = record->job;
    }
    if (job.status != JobStatus::COMPLETED)
    {
        // Cancelled before commit: the finished result is discarded
        finishCancelled(record);
        return;
    }

    persistJob(record);
    if (components_.database)
        components_.database->saveResult(result);

    Logger::info("Job " + job.job_id + " completed with overall score " + std::to_string(result.overall_score));
    notifyUser(job, "analysis.completed",
               json{{"job_id", job.job_id},
                    {"video_id", job.video_id},
                    {"overall_score", result.overall_score},
                    {"difficulty_score", result.difficulty_score},
                    {"stability_score", result.stability_score},
                    {"segment_count", result.segments.size()}});
}

void PipelineOrchestrator::finishCancelled(const std::shared_ptr<JobRecord> &record)
{
    std::string job_id;
    {
        std::unique_lock<std::shared_mutex> lock(record->mutex);
        if (JobStatuses::isTerminal(record->job.status))
            return;
        record->job.status = JobStatus::CANCELLED;
        record->job.updated_at = std::chrono::system_clock::now();
        job_id = record->job.job_id;
    }
    Logger::info("Job " + job_id + " cancelled");
    persistJob(record);
    removeArtifacts(job_id);
}

void PipelineOrchestrator::finishFailed(const std::shared_ptr<JobRecord> &record, const std::string &error_message)
{
    if (record->token->isCancelled())
    {
        Logger::info("Job " + record->job.job_id + " failed after cancellation was requested: " + error_message);
        finishCancelled(record);
        return;
    }

    VideoJob job;
    {
        std::unique_lock<std::shared_mutex> lock(record->mutex);
        if (JobStatuses::isTerminal(record->job.status))
            return;
        record->job.status = JobStatus::FAILED;
        record->job.error_message = error_message;
        record->job.updated_at = std::chrono::system_clock::now();
        job = record->job;
    }
    Logger::error("Job " + job.job_id + " failed: " + error_message);
    persistJob(record);
    removeArtifacts(job.job_id);
    notifyUser(job, "analysis.failed",
               json{{"job_id", job.job_id}, {"video_id", job.video_id}, {"error_message", error_message}});
}

void PipelineOrchestrator::removeArtifacts(const std::string &job_id)
{
    try
    {
        size_t removed = components_.store->removePrefix(artifactPrefix(job_id));
        Logger::debug("Removed " + std::to_string(removed) + " artifacts of job " + job_id);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Could not clean up artifacts of job " + job_id + ": " + std::string(e.what()));
    }
}

void PipelineOrchestrator::persistJob(const std::shared_ptr<JobRecord> &record)
{
    if (!components_.database)
        return;
    VideoJob job;
    int retry_count = 0;
    {
        std::shared_lock<std::shared_mutex> lock(record->mutex);
        job = record->job;
        retry_count = record->retry_count;
    }
    components_.database->saveJob(job, retry_count);
}

void PipelineOrchestrator::notifyUser(const VideoJob &job, const std::string &event, const json &payload)
{
    try
    {
        components_.notifier->notify(job.user_id, event, payload);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Notification " + event + " for job " + job.job_id + " failed: " + std::string(e.what()));
    }
}
