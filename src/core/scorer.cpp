#include "core/scorer.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace
{
    double populationVariance(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end)
    {
        const double count = static_cast<double>(std::distance(begin, end));
        double mean = 0.0;
        for (auto it = begin; it != end; ++it)
            mean += *it;
        mean /= count;
        double variance = 0.0;
        for (auto it = begin; it != end; ++it)
            variance += (*it - mean) * (*it - mean);
        return variance / count;
    }
}

Scorer::Scorer(const ScoringConfig &config) : config_(config) {}

double Scorer::roundToTenth(double value)
{
    return std::round(value * 10.0) / 10.0;
}

double Scorer::coverage(const std::vector<PoseFrame> &series)
{
    if (series.empty())
        return 0.0;
    size_t detected = 0;
    for (const auto &frame : series)
    {
        if (!frame.interpolated)
            ++detected;
    }
    return static_cast<double>(detected) / static_cast<double>(series.size());
}

std::vector<double> Scorer::jitterSamples(const std::vector<PoseFrame> &series)
{
    std::vector<double> samples;
    for (size_t i = 1; i < series.size(); ++i)
    {
        const PoseFrame &previous = series[i - 1];
        const PoseFrame &current = series[i];
        if (previous.interpolated || current.interpolated)
            continue;
        const size_t joints = std::min(previous.keypoints.size(), current.keypoints.size());
        if (joints == 0)
            continue;

        double displacement = 0.0;
        for (size_t joint = 0; joint < joints; ++joint)
        {
            displacement += std::hypot(current.keypoints[joint].x - previous.keypoints[joint].x,
                                       current.keypoints[joint].y - previous.keypoints[joint].y);
        }
        samples.push_back(displacement / static_cast<double>(joints));
    }
    return samples;
}

double Scorer::stability(const std::vector<PoseFrame> &series) const
{
    const std::vector<double> samples = jitterSamples(series);
    if (samples.size() < 2)
        return 0.0;

    const size_t window = std::min(std::max<size_t>(config_.stability_window, 1), samples.size());
    double variance_sum = 0.0;
    size_t window_count = 0;
    for (size_t start = 0; start + window <= samples.size(); ++start)
    {
        variance_sum += populationVariance(samples.begin() + start, samples.begin() + start + window);
        ++window_count;
    }
    const double mean_variance = variance_sum / static_cast<double>(window_count);
    return 100.0 / (1.0 + config_.stability_sensitivity * mean_variance);
}

double Scorer::difficulty(const std::vector<TrickSegment> &segments, const StyleProfile &style) const
{
    double total = 0.0;
    for (const auto &segment : segments)
    {
        auto weight = style.trick_weights.find(segment.label);
        double label_weight = weight != style.trick_weights.end() ? weight->second : config_.default_trick_weight;
        total += label_weight * segment.confidence;
    }
    return std::min(100.0, total);
}

std::vector<std::string> Scorer::feedback(const ScoreCard &card, bool has_segments) const
{
    std::vector<std::string> messages;
    if (card.overall >= 80.0)
        messages.push_back("Excellent run overall!");
    else if (card.overall >= 60.0)
        messages.push_back("Solid run. Review the notes below to improve.");
    else
        messages.push_back("Building fundamentals. Keep practicing!");

    if (card.stability < config_.low_stability_cutoff)
        messages.push_back("Stability is low: keep your knees bent and your upper body quiet to reduce wobble.");
    if (!has_segments)
        messages.push_back("No tricks were detected. Try a clip that includes a jump, grab or carve.");
    if (card.coverage < config_.low_coverage_cutoff)
        messages.push_back("The rider was hard to track in much of the clip; film closer with the whole body in frame.");
    return messages;
}

ScoreCard Scorer::score(const std::vector<PoseFrame> &series, const std::vector<TrickSegment> &segments,
                        const StyleProfile &style) const
{
    const double coverage_fraction = coverage(series);
    const double stability_score = stability(series);
    const double difficulty_score = difficulty(segments, style);
    const double overall = config_.stability_weight * stability_score +
                           config_.difficulty_weight * difficulty_score +
                           config_.coverage_weight * 100.0 * coverage_fraction;

    ScoreCard card;
    card.coverage = coverage_fraction;
    card.stability = roundToTenth(std::clamp(stability_score, 0.0, 100.0));
    card.difficulty = roundToTenth(std::clamp(difficulty_score, 0.0, 100.0));
    card.overall = roundToTenth(std::clamp(overall, 0.0, 100.0));
    card.feedback = feedback(card, !segments.empty());
    return card;
}
