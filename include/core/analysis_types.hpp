#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Lifecycle states of a video analysis job
 *
 * queued is the only initial state; completed, failed and cancelled are terminal.
 */
enum class JobStatus
{
    QUEUED,
    EXTRACTING,
    ESTIMATING_POSE,
    CLASSIFYING,
    SCORING_RENDERING,
    COMPLETED,
    FAILED,
    CANCELLED
};

class JobStatuses
{
public:
    /**
     * @brief Get the wire name of a status
     * @param status The job status
     * @return Lower-case status name (e.g. "estimating_pose")
     */
    static std::string getStatusName(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::QUEUED:
            return "queued";
        case JobStatus::EXTRACTING:
            return "extracting";
        case JobStatus::ESTIMATING_POSE:
            return "estimating_pose";
        case JobStatus::CLASSIFYING:
            return "classifying";
        case JobStatus::SCORING_RENDERING:
            return "scoring_rendering";
        case JobStatus::COMPLETED:
            return "completed";
        case JobStatus::FAILED:
            return "failed";
        case JobStatus::CANCELLED:
            return "cancelled";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Convert a wire name back to a status
     * @param name Status name as produced by getStatusName
     * @return Matching status, or std::nullopt for unknown names
     */
    static std::optional<JobStatus> fromString(const std::string &name)
    {
        for (JobStatus status : {JobStatus::QUEUED, JobStatus::EXTRACTING, JobStatus::ESTIMATING_POSE,
                                 JobStatus::CLASSIFYING, JobStatus::SCORING_RENDERING, JobStatus::COMPLETED,
                                 JobStatus::FAILED, JobStatus::CANCELLED})
        {
            if (getStatusName(status) == name)
                return status;
        }
        return std::nullopt;
    }

    static bool isTerminal(JobStatus status)
    {
        return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
    }

    /**
     * @brief Progress reached once the given stage has finished
     *
     * Bands: extraction 10, pose 40, classification 20, scoring+rendering 30.
     */
    static int progressAfter(JobStatus stage)
    {
        switch (stage)
        {
        case JobStatus::EXTRACTING:
            return 10;
        case JobStatus::ESTIMATING_POSE:
            return 50;
        case JobStatus::CLASSIFYING:
            return 70;
        case JobStatus::SCORING_RENDERING:
        case JobStatus::COMPLETED:
            return 100;
        default:
            return 0;
        }
    }
};

/**
 * @brief One skeletal joint in normalized image coordinates
 */
struct Keypoint
{
    double x = 0.0;
    double y = 0.0;
    double confidence = 0.0;

    Keypoint() = default;
    Keypoint(double px, double py, double c) : x(px), y(py), confidence(c) {}
};

/**
 * @brief Pose of a single sampled frame
 *
 * interpolated is set when the keypoints were synthesized from neighbouring
 * frames (or zeroed at a sequence boundary) instead of detected.
 */
struct PoseFrame
{
    size_t frame_index = 0;
    double timestamp_ms = 0.0;
    std::vector<Keypoint> keypoints;
    bool interpolated = false;
};

/**
 * @brief Contiguous frame range labelled as one maneuver, end_frame exclusive
 */
struct TrickSegment
{
    size_t start_frame = 0;
    size_t end_frame = 0;
    std::string label;
    double confidence = 0.0;

    size_t length() const { return end_frame > start_frame ? end_frame - start_frame : 0; }
    bool overlaps(const TrickSegment &other) const
    {
        return start_frame < other.end_frame && other.start_frame < end_frame;
    }
};

/**
 * @brief Scores and feedback produced by the scorer
 */
struct ScoreCard
{
    double overall = 0.0;
    double difficulty = 0.0;
    double stability = 0.0;
    double coverage = 0.0; // Fraction of detected (non-interpolated) frames
    std::vector<std::string> feedback;
};

/**
 * @brief Final, immutable outcome of a completed job
 */
struct AnalysisResult
{
    std::string job_id;
    std::string video_id;
    double overall_score = 0.0;
    double difficulty_score = 0.0;
    double stability_score = 0.0;
    std::vector<TrickSegment> segments;
    std::vector<std::string> feedback;
    std::string animation_artifact_ref;
    std::string highlight_artifact_ref;
    size_t frame_count = 0;
    size_t interpolated_frame_count = 0;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief One end-to-end analysis request, owned by the orchestrator
 */
struct VideoJob
{
    std::string job_id;
    std::string video_id;
    std::string user_id;
    std::string style;
    JobStatus status = JobStatus::QUEUED;
    int progress = 0;
    std::optional<std::string> error_message; // Present only when status is FAILED
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Snapshot returned to polling callers
 */
struct JobStatusReport
{
    JobStatus status = JobStatus::QUEUED;
    int progress = 0;
    std::optional<std::string> error_message;
    int retry_count = 0;

    bool operator==(const JobStatusReport &other) const
    {
        return status == other.status && progress == other.progress &&
               error_message == other.error_message && retry_count == other.retry_count;
    }
};

/**
 * @brief Fresh presigned URLs for the artifacts of a completed job
 */
struct ArtifactUrls
{
    std::string animation_url;
    std::string highlight_url;
};
