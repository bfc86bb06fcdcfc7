#pragma once

#include <cstddef>
#include <vector>
#include "core/analysis_types.hpp"

/**
 * @brief MediaPipe joint indices of the 33-joint source topology
 */
enum PoseJoint : size_t
{
    NOSE = 0,
    LEFT_SHOULDER = 11,
    RIGHT_SHOULDER = 12,
    LEFT_ELBOW = 13,
    RIGHT_ELBOW = 14,
    LEFT_WRIST = 15,
    RIGHT_WRIST = 16,
    LEFT_INDEX = 19,
    RIGHT_INDEX = 20,
    LEFT_HIP = 23,
    RIGHT_HIP = 24,
    LEFT_KNEE = 25,
    RIGHT_KNEE = 26,
    LEFT_ANKLE = 27,
    RIGHT_ANKLE = 28,
    LEFT_FOOT = 31,
    RIGHT_FOOT = 32,
    POSE_JOINT_COUNT = 33
};

/**
 * @brief Derived per-frame riding features
 */
struct FrameFeatures
{
    double center_of_mass_x = 0.0;
    double center_of_mass_y = 0.0;
    double board_angle = 0.0;    // Degrees of the left-foot to right-foot vector
    double knee_angle_left = 0.0;
    double knee_angle_right = 0.0;
    double shoulder_angle = 0.0; // Degrees of the left-shoulder to right-shoulder vector
    bool airborne = false;
};

class PoseFeatures
{
public:
    /**
     * @brief Compute features for every frame of a series
     *
     * Frames without the full topology keep default features. Ground level is
     * the 80th percentile of detected foot y values; a frame is airborne when
     * both feet are above ground - 0.05. Interpolated frames are never airborne.
     */
    static std::vector<FrameFeatures> compute(const std::vector<PoseFrame> &series);

    /**
     * @brief Angle at vertex b of the triangle a-b-c, in degrees
     */
    static double jointAngle(const Keypoint &a, const Keypoint &b, const Keypoint &c);

    static double lineAngle(const Keypoint &from, const Keypoint &to);

    static bool hasFullTopology(const PoseFrame &frame)
    {
        return frame.keypoints.size() >= POSE_JOINT_COUNT;
    }
};
