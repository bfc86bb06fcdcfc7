#include "core/trick_segmenter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

TrickSegmenter::TrickSegmenter(std::shared_ptr<TrickModel> model, const SegmentationConfig &config)
    : model_(std::move(model)), config_(config)
{
    if (!model_)
        throw std::invalid_argument("TrickSegmenter requires a model");
}

std::vector<TrickSegment> TrickSegmenter::segment(const std::vector<PoseFrame> &series, const StyleProfile &style) const
{
    FrameLabelScores scores = model_->predict(series);
    validateScores(scores, series.size());

    std::vector<TrickSegment> candidates = findCandidates(scores, config_);
    std::vector<TrickSegment> segments = selectSegments(std::move(candidates), style, config_.tie_epsilon);

    Logger::debug("Segmented " + std::to_string(series.size()) + " frames into " +
                  std::to_string(segments.size()) + " segments");
    return segments;
}

void TrickSegmenter::validateScores(const FrameLabelScores &scores, size_t frame_count)
{
    if (scores.labels.empty())
        throw InferenceError("trick model returned an empty label list");
    if (scores.scores.size() != frame_count)
        throw InferenceError("trick model returned " + std::to_string(scores.scores.size()) + " score rows for " +
                             std::to_string(frame_count) + " frames");

    const size_t label_count = scores.labels.size();
    for (size_t frame = 0; frame < scores.scores.size(); ++frame)
    {
        const auto &row = scores.scores[frame];
        if (row.size() != label_count)
            throw InferenceError("trick model returned " + std::to_string(row.size()) + " scores at frame " +
                                 std::to_string(frame) + ", expected " + std::to_string(label_count));
        for (double value : row)
        {
            if (std::isnan(value))
                throw InferenceError("trick model returned NaN score at frame " + std::to_string(frame));
            if (!std::isfinite(value) || value < 0.0 || value > 1.0)
                throw InferenceError("trick model returned out-of-range score " + std::to_string(value) +
                                     " at frame " + std::to_string(frame));
        }
    }
}

std::vector<TrickSegment> TrickSegmenter::findCandidates(const FrameLabelScores &scores,
                                                         const SegmentationConfig &config)
{
    std::vector<TrickSegment> candidates;
    const size_t frame_count = scores.scores.size();

    for (size_t label = 0; label < scores.labels.size(); ++label)
    {
        if (scores.labels[label] == config.neutral_label)
            continue;

        size_t frame = 0;
        while (frame < frame_count)
        {
            if (scores.scores[frame][label] < config.detection_threshold)
            {
                ++frame;
                continue;
            }

            size_t run_start = frame;
            double score_sum = 0.0;
            while (frame < frame_count && scores.scores[frame][label] >= config.detection_threshold)
            {
                score_sum += scores.scores[frame][label];
                ++frame;
            }

            const size_t run_length = frame - run_start;
            if (run_length < config.min_segment_frames)
                continue; // Too short to be a maneuver, left in the neutral gap

            TrickSegment candidate;
            candidate.start_frame = run_start;
            candidate.end_frame = frame;
            candidate.label = scores.labels[label];
            candidate.confidence = score_sum / static_cast<double>(run_length);
            candidates.push_back(candidate);
        }
    }
    return candidates;
}

std::vector<TrickSegment> TrickSegmenter::selectSegments(std::vector<TrickSegment> candidates,
                                                         const StyleProfile &style, double tie_epsilon)
{
    std::vector<TrickSegment> selected;

    while (!candidates.empty())
    {
        double best_confidence = 0.0;
        for (const auto &candidate : candidates)
            best_confidence = std::max(best_confidence, candidate.confidence);

        // Among candidates inside the epsilon band: preferred label, then
        // longer, then more confident, then earlier
        auto better = [&style](const TrickSegment &a, const TrickSegment &b)
        {
            bool a_preferred = style.prefers(a.label);
            bool b_preferred = style.prefers(b.label);
            if (a_preferred != b_preferred)
                return a_preferred;
            if (a.length() != b.length())
                return a.length() > b.length();
            if (a.confidence != b.confidence)
                return a.confidence > b.confidence;
            return a.start_frame < b.start_frame;
        };

        const TrickSegment *pick = nullptr;
        for (const auto &candidate : candidates)
        {
            if (candidate.confidence < best_confidence - tie_epsilon)
                continue;
            if (!pick || better(candidate, *pick))
                pick = &candidate;
        }

        TrickSegment chosen = *pick;
        selected.push_back(chosen);
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&chosen](const TrickSegment &candidate)
                                        { return candidate.overlaps(chosen); }),
                         candidates.end());
    }

    std::sort(selected.begin(), selected.end(),
              [](const TrickSegment &a, const TrickSegment &b)
              { return a.start_frame < b.start_frame; });
    return selected;
}
