#include "core/json_serialization.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

void to_json(json &j, const Keypoint &keypoint)
{
    j = json{{"x", keypoint.x}, {"y", keypoint.y}, {"confidence", keypoint.confidence}};
}

void from_json(const json &j, Keypoint &keypoint)
{
    j.at("x").get_to(keypoint.x);
    j.at("y").get_to(keypoint.y);
    j.at("confidence").get_to(keypoint.confidence);
}

void to_json(json &j, const PoseFrame &frame)
{
    j = json{{"frame_index", frame.frame_index},
             {"timestamp_ms", frame.timestamp_ms},
             {"interpolated", frame.interpolated},
             {"keypoints", frame.keypoints}};
}

void from_json(const json &j, PoseFrame &frame)
{
    j.at("frame_index").get_to(frame.frame_index);
    j.at("timestamp_ms").get_to(frame.timestamp_ms);
    j.at("interpolated").get_to(frame.interpolated);
    j.at("keypoints").get_to(frame.keypoints);
}

void to_json(json &j, const TrickSegment &segment)
{
    j = json{{"start_frame", segment.start_frame},
             {"end_frame", segment.end_frame},
             {"label", segment.label},
             {"confidence", segment.confidence}};
}

void from_json(const json &j, TrickSegment &segment)
{
    j.at("start_frame").get_to(segment.start_frame);
    j.at("end_frame").get_to(segment.end_frame);
    j.at("label").get_to(segment.label);
    j.at("confidence").get_to(segment.confidence);
}

void to_json(json &j, const AnalysisResult &result)
{
    j = json{{"job_id", result.job_id},
             {"video_id", result.video_id},
             {"overall_score", result.overall_score},
             {"difficulty_score", result.difficulty_score},
             {"stability_score", result.stability_score},
             {"segments", result.segments},
             {"feedback", result.feedback},
             {"animation_artifact_ref", result.animation_artifact_ref},
             {"highlight_artifact_ref", result.highlight_artifact_ref},
             {"frame_count", result.frame_count},
             {"interpolated_frame_count", result.interpolated_frame_count},
             {"created_at", json_time::toIso8601(result.created_at)}};
}

void from_json(const json &j, AnalysisResult &result)
{
    j.at("job_id").get_to(result.job_id);
    j.at("video_id").get_to(result.video_id);
    j.at("overall_score").get_to(result.overall_score);
    j.at("difficulty_score").get_to(result.difficulty_score);
    j.at("stability_score").get_to(result.stability_score);
    j.at("segments").get_to(result.segments);
    j.at("feedback").get_to(result.feedback);
    j.at("animation_artifact_ref").get_to(result.animation_artifact_ref);
    j.at("highlight_artifact_ref").get_to(result.highlight_artifact_ref);
    result.frame_count = j.value("frame_count", static_cast<size_t>(0));
    result.interpolated_frame_count = j.value("interpolated_frame_count", static_cast<size_t>(0));
    result.created_at = json_time::fromIso8601(j.at("created_at").get<std::string>());
}

void to_json(json &j, const JobStatusReport &report)
{
    j = json{{"status", JobStatuses::getStatusName(report.status)},
             {"progress", report.progress},
             {"retry_count", report.retry_count}};
    if (report.error_message)
        j["error_message"] = *report.error_message;
    else
        j["error_message"] = nullptr;
}

namespace json_time
{
    std::string toIso8601(std::chrono::system_clock::time_point time)
    {
        std::time_t seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::chrono::system_clock::time_point fromIso8601(const std::string &text)
    {
        std::tm utc{};
        std::istringstream ss(text);
        ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        if (ss.fail())
            throw std::invalid_argument("invalid timestamp: " + text);
        return std::chrono::system_clock::from_time_t(timegm(&utc));
    }
}

std::vector<uint8_t> toArtifactBytes(const json &document)
{
    const std::string text = document.dump(2);
    return std::vector<uint8_t>(text.begin(), text.end());
}
