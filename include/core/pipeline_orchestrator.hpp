#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"
#include "core/animation_renderer.hpp"
#include "core/artifact_store.hpp"
#include "core/error_recovery.hpp"
#include "core/frame_sampler.hpp"
#include "core/job_store.hpp"
#include "core/notifier.hpp"
#include "core/pose_estimator.hpp"
#include "core/scorer.hpp"
#include "core/task_queue.hpp"
#include "core/trick_segmenter.hpp"

class JobDatabase;

/**
 * @brief Collaborators the orchestrator drives
 *
 * database is optional; every other member is required.
 */
struct PipelineComponents
{
    std::shared_ptr<FrameSampler> sampler;
    std::shared_ptr<PoseEstimator> estimator;
    std::shared_ptr<TrickModel> trick_model;
    std::shared_ptr<ClipEncoder> encoder;
    std::shared_ptr<ArtifactStore> store;
    std::shared_ptr<TaskQueue> queue;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<JobDatabase> database;
};

/**
 * @brief Drives video analysis jobs through the stage state machine
 *
 * queued -> extracting -> estimating_pose -> classifying -> scoring_rendering -> completed,
 * with failed and cancelled reachable from any non-terminal state. Each job
 * body runs on the task queue; the body is the only writer of its job's
 * stage transitions. Stage errors never escape: they are recorded on the job
 * as "<KindName>: <message>".
 */
class PipelineOrchestrator
{
public:
    /**
     * @throws std::invalid_argument when a required component is missing
     */
    PipelineOrchestrator(const AnalysisConfig &config, PipelineComponents components);

    /**
     * @brief Waits for running job bodies before tearing down
     */
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator &) = delete;
    PipelineOrchestrator &operator=(const PipelineOrchestrator &) = delete;

    /**
     * @brief Validate the request, create a queued job and enqueue its pipeline
     * @param video_ref Storage key of the uploaded video
     * @param user_id Owner of the job, receives the notification
     * @param style Name of a configured style profile
     * @return New job id ("job-" followed by 16 hex characters)
     * @throws ValidationError when the request is rejected; no job is created
     */
    std::string submit(const std::string &video_ref, const std::string &user_id, const std::string &style);

    /**
     * @return Status snapshot, std::nullopt for an unknown job id
     */
    std::optional<JobStatusReport> getStatus(const std::string &job_id) const;

    /**
     * @return The result, present iff the job is completed
     */
    std::optional<AnalysisResult> getResult(const std::string &job_id) const;

    /**
     * @brief Request cooperative cancellation
     * @return true iff the job existed and was non-terminal at the time of the call
     */
    bool cancel(const std::string &job_id);

    /**
     * @brief Cancel every non-terminal job
     * @return Number of jobs that were signalled
     */
    size_t cancelAll();

    /**
     * @brief Fresh presigned URLs for the artifacts of a completed job
     */
    std::optional<ArtifactUrls> presignArtifacts(const std::string &job_id) const;

    /**
     * @brief Reload persisted jobs and results
     *
     * Jobs that were still running when the process stopped are marked failed.
     * @return Number of jobs restored
     */
    size_t restoreFromDatabase();

    /**
     * @brief Block until every enqueued job body has finished
     */
    void waitForIdle();

    std::vector<std::string> jobIds() const;

private:
    void runPipeline(const std::shared_ptr<JobRecord> &record, const StyleProfile &style);

    /**
     * @brief Move the job into stage, or into cancelled if cancellation was requested
     * @return false when the job was cancelled instead
     */
    bool enterStage(const std::shared_ptr<JobRecord> &record, JobStatus stage, JobStatus previous);

    void commitResult(const std::shared_ptr<JobRecord> &record, AnalysisResult result);
    void finishCancelled(const std::shared_ptr<JobRecord> &record);
    void finishFailed(const std::shared_ptr<JobRecord> &record, const std::string &error_message);

    /**
     * @brief Fetched video with its frame sequence positioned after the first frame
     */
    struct OpenedVideo
    {
        VideoBytes bytes;
        std::unique_ptr<FrameSequence> frames;
        std::optional<SampledFrame> first;
    };

    OpenedVideo openVideo(const std::shared_ptr<JobRecord> &record, const std::string &video_ref);

    /**
     * @brief Decode the remaining frames one at a time, estimating each as it arrives
     */
    std::vector<PoseFrame> estimatePoses(const std::shared_ptr<JobRecord> &record, OpenedVideo video);
    std::vector<TrickSegment> classify(const std::shared_ptr<JobRecord> &record,
                                       const std::vector<PoseFrame> &series, const StyleProfile &style);
    AnalysisResult scoreAndRender(const std::shared_ptr<JobRecord> &record,
                                  std::shared_ptr<const std::vector<PoseFrame>> series,
                                  std::shared_ptr<const std::vector<TrickSegment>> segments,
                                  const StyleProfile &style);

    std::string storeArtifact(const std::shared_ptr<JobRecord> &record, const std::string &key,
                              const std::vector<uint8_t> &bytes);
    void removeArtifacts(const std::string &job_id);
    void persistJob(const std::shared_ptr<JobRecord> &record);
    void notifyUser(const VideoJob &job, const std::string &event, const nlohmann::json &payload);

    std::function<void(int)> retryCounter(const std::shared_ptr<JobRecord> &record) const;
    RetryPolicy transientPolicy() const;
    RetryPolicy renderPolicy() const;
    std::string generateJobId() const;

    static std::string artifactPrefix(const std::string &job_id);

    AnalysisConfig config_;
    PipelineComponents components_;
    TrickSegmenter segmenter_;
    Scorer scorer_;
    AnimationRenderer renderer_;
    JobStore jobs_;
};
