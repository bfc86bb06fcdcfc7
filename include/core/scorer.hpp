#pragma once

#include <string>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"

/**
 * @brief Aggregates pose stability, maneuver difficulty and tracking coverage
 *
 * Deterministic: identical inputs give identical scores and feedback.
 */
class Scorer
{
public:
    explicit Scorer(const ScoringConfig &config);

    ScoreCard score(const std::vector<PoseFrame> &series, const std::vector<TrickSegment> &segments,
                    const StyleProfile &style) const;

    /**
     * @brief Fraction of frames that were detected rather than synthesized
     */
    static double coverage(const std::vector<PoseFrame> &series);

    /**
     * @brief Mean joint displacement between consecutive detected frames
     */
    static std::vector<double> jitterSamples(const std::vector<PoseFrame> &series);

    double stability(const std::vector<PoseFrame> &series) const;
    double difficulty(const std::vector<TrickSegment> &segments, const StyleProfile &style) const;
    std::vector<std::string> feedback(const ScoreCard &card, bool has_segments) const;

    static double roundToTenth(double value);

private:
    ScoringConfig config_;
};
