#include "core/pose_features.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
    constexpr double kGroundPercentile = 0.8;
    constexpr double kAirborneClearance = 0.05;

    // Linear interpolation between closest ranks, matching numpy's default
    double percentile(std::vector<double> values, double fraction)
    {
        std::sort(values.begin(), values.end());
        double rank = fraction * static_cast<double>(values.size() - 1);
        size_t lower = static_cast<size_t>(std::floor(rank));
        size_t upper = std::min(lower + 1, values.size() - 1);
        double weight = rank - static_cast<double>(lower);
        return values[lower] + (values[upper] - values[lower]) * weight;
    }
}

double PoseFeatures::jointAngle(const Keypoint &a, const Keypoint &b, const Keypoint &c)
{
    double bax = a.x - b.x;
    double bay = a.y - b.y;
    double bcx = c.x - b.x;
    double bcy = c.y - b.y;
    double norms = std::hypot(bax, bay) * std::hypot(bcx, bcy) + 1e-8;
    double cosine = std::clamp((bax * bcx + bay * bcy) / norms, -1.0, 1.0);
    return std::acos(cosine) * kRadToDeg;
}

double PoseFeatures::lineAngle(const Keypoint &from, const Keypoint &to)
{
    return std::atan2(to.y - from.y, to.x - from.x) * kRadToDeg;
}

std::vector<FrameFeatures> PoseFeatures::compute(const std::vector<PoseFrame> &series)
{
    std::vector<FrameFeatures> features(series.size());
    std::vector<double> foot_heights;

    for (size_t i = 0; i < series.size(); ++i)
    {
        const PoseFrame &frame = series[i];
        if (!hasFullTopology(frame))
            continue;
        const auto &k = frame.keypoints;
        FrameFeatures &f = features[i];

        f.center_of_mass_x = (k[LEFT_HIP].x + k[RIGHT_HIP].x + k[LEFT_SHOULDER].x + k[RIGHT_SHOULDER].x) / 4.0;
        f.center_of_mass_y = (k[LEFT_HIP].y + k[RIGHT_HIP].y + k[LEFT_SHOULDER].y + k[RIGHT_SHOULDER].y) / 4.0;
        f.board_angle = lineAngle(k[LEFT_FOOT], k[RIGHT_FOOT]);
        f.knee_angle_left = jointAngle(k[LEFT_HIP], k[LEFT_KNEE], k[LEFT_ANKLE]);
        f.knee_angle_right = jointAngle(k[RIGHT_HIP], k[RIGHT_KNEE], k[RIGHT_ANKLE]);
        f.shoulder_angle = lineAngle(k[LEFT_SHOULDER], k[RIGHT_SHOULDER]);

        if (!frame.interpolated)
        {
            foot_heights.push_back(k[LEFT_FOOT].y);
            foot_heights.push_back(k[RIGHT_FOOT].y);
        }
    }

    if (foot_heights.empty())
        return features;

    // Image y grows downwards, so "above ground" means a smaller y
    const double airborne_threshold = percentile(foot_heights, kGroundPercentile) - kAirborneClearance;
    for (size_t i = 0; i < series.size(); ++i)
    {
        const PoseFrame &frame = series[i];
        if (frame.interpolated || !hasFullTopology(frame))
            continue;
        features[i].airborne = frame.keypoints[LEFT_FOOT].y < airborne_threshold &&
                               frame.keypoints[RIGHT_FOOT].y < airborne_threshold;
    }
    return features;
}
