#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"

/**
 * @brief Per-frame label scores over a whole pose series
 *
 * scores[i][k] is the score of labels[k] at frame i, each within [0, 1].
 */
struct FrameLabelScores
{
    std::vector<std::string> labels;
    std::vector<std::vector<double>> scores;
};

/**
 * @brief Opaque maneuver model
 */
class TrickModel
{
public:
    virtual ~TrickModel() = default;
    virtual FrameLabelScores predict(const std::vector<PoseFrame> &series) = 0;
};

/**
 * @brief Partitions a complete pose series into labelled, non-overlapping segments
 */
class TrickSegmenter
{
public:
    TrickSegmenter(std::shared_ptr<TrickModel> model, const SegmentationConfig &config);

    /**
     * @brief Segment the series
     * @return Segments sorted by start_frame, pairwise non-overlapping
     * @throws InferenceError when the model output is malformed
     */
    std::vector<TrickSegment> segment(const std::vector<PoseFrame> &series, const StyleProfile &style) const;

    /**
     * @throws InferenceError on wrong dimensions, an empty label list or a
     * score that is not a finite value within [0, 1]
     */
    static void validateScores(const FrameLabelScores &scores, size_t frame_count);

    /**
     * @brief Maximal above-threshold runs of every non-neutral label, shorter runs dropped
     */
    static std::vector<TrickSegment> findCandidates(const FrameLabelScores &scores, const SegmentationConfig &config);

    /**
     * @brief Greedy non-overlapping selection with the style-aware tie-break
     */
    static std::vector<TrickSegment> selectSegments(std::vector<TrickSegment> candidates, const StyleProfile &style,
                                                    double tie_epsilon);

private:
    std::shared_ptr<TrickModel> model_;
    SegmentationConfig config_;
};
