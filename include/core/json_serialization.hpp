#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/analysis_types.hpp"

// nlohmann::json conversions for the stage artifacts and results

void to_json(nlohmann::json &j, const Keypoint &keypoint);
void from_json(const nlohmann::json &j, Keypoint &keypoint);

void to_json(nlohmann::json &j, const PoseFrame &frame);
void from_json(const nlohmann::json &j, PoseFrame &frame);

void to_json(nlohmann::json &j, const TrickSegment &segment);
void from_json(const nlohmann::json &j, TrickSegment &segment);

void to_json(nlohmann::json &j, const AnalysisResult &result);
void from_json(const nlohmann::json &j, AnalysisResult &result);

void to_json(nlohmann::json &j, const JobStatusReport &report);

namespace json_time
{
    /**
     * @brief Format a time point as UTC ISO-8601 ("2024-01-31T12:00:00Z")
     */
    std::string toIso8601(std::chrono::system_clock::time_point time);

    /**
     * @throws std::invalid_argument on malformed input
     */
    std::chrono::system_clock::time_point fromIso8601(const std::string &text);
}

/**
 * @brief Serialize to the UTF-8 bytes stored as an artifact
 */
std::vector<uint8_t> toArtifactBytes(const nlohmann::json &document);
