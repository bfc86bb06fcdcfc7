#pragma once

#include <cstddef>
#include <vector>
#include "core/analysis_types.hpp"
#include "core/pose_estimator.hpp"

/**
 * @brief Turns per-frame estimates into a gap-free pose series
 *
 * A run of low-confidence markers bracketed by detected frames on both sides
 * is filled by per-joint linear interpolation in frame-index space. A run
 * touching the start or end of the series without an anchor on that side gets
 * zeroed keypoints. Every synthesized frame is flagged interpolated.
 */
class PoseAssembler
{
public:
    /**
     * @param estimates Estimates ordered by frame_index, one per sampled frame
     * @param joint_count Joints per frame, used for zeroed boundary frames
     * @throws std::invalid_argument when the estimates are not numbered 0..N-1
     */
    static std::vector<PoseFrame> assemble(const std::vector<PoseEstimate> &estimates, size_t joint_count);

    static size_t countInterpolated(const std::vector<PoseFrame> &series);
};
