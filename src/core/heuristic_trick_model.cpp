#include "core/heuristic_trick_model.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include "core/pose_features.hpp"

namespace
{
    constexpr size_t kMinAirborneFrames = 3;
    constexpr double kGrabDistance = 0.1;
    constexpr size_t kCarvingWindow = 10;
    constexpr size_t kCarvingStep = 5;
    constexpr double kCarvingAngleRange = 20.0;

    size_t labelIndex(const std::string &label)
    {
        const auto &classes = HeuristicTrickModel::trickClasses();
        return static_cast<size_t>(std::find(classes.begin(), classes.end(), label) - classes.begin());
    }

    double roundTo2(double value)
    {
        return std::round(value * 100.0) / 100.0;
    }

    bool handNearFeet(const PoseFrame &frame)
    {
        const auto &k = frame.keypoints;
        double foot_x = (k[LEFT_FOOT].x + k[RIGHT_FOOT].x) / 2.0;
        double foot_y = (k[LEFT_FOOT].y + k[RIGHT_FOOT].y) / 2.0;
        for (size_t hand : {static_cast<size_t>(LEFT_INDEX), static_cast<size_t>(RIGHT_INDEX)})
        {
            if (std::hypot(k[hand].x - foot_x, k[hand].y - foot_y) < kGrabDistance)
                return true;
        }
        return false;
    }

    // Label and confidence of one airborne run [start, end)
    std::pair<std::string, double> classifyAirborne(const std::vector<PoseFrame> &series,
                                                    const std::vector<FrameFeatures> &features,
                                                    size_t start, size_t end)
    {
        for (size_t i = start; i < end; ++i)
        {
            if (handNearFeet(series[i]))
                return {"grab_indy", 0.6};
        }

        double rotation = std::abs(features[end - 1].shoulder_angle - features[start].shoulder_angle);
        if (rotation > 150.0)
            return {"jump_360", roundTo2(0.5 + std::min(0.4, rotation / 500.0))};
        if (rotation > 80.0)
            return {"jump_180", roundTo2(0.6 + std::min(0.3, rotation / 300.0))};
        return {"jump_straight", 0.7};
    }
}

const std::vector<std::string> &HeuristicTrickModel::trickClasses()
{
    static const std::vector<std::string> classes = {
        "straight_ride", "ollie", "nollie", "jump_straight", "jump_180", "jump_360",
        "grab_indy", "grab_mute", "rail_50_50", "rail_boardslide", "butter", "carving"};
    return classes;
}

FrameLabelScores HeuristicTrickModel::predict(const std::vector<PoseFrame> &series)
{
    FrameLabelScores result;
    result.labels = trickClasses();
    result.scores.assign(series.size(), std::vector<double>(result.labels.size(), 0.0));

    const std::vector<FrameFeatures> features = PoseFeatures::compute(series);

    // Airborne runs
    size_t i = 0;
    while (i < series.size())
    {
        if (!features[i].airborne)
        {
            ++i;
            continue;
        }
        size_t run_start = i;
        while (i < series.size() && features[i].airborne)
            ++i;
        if (i - run_start < kMinAirborneFrames)
            continue;

        auto [label, confidence] = classifyAirborne(series, features, run_start, i);
        size_t column = labelIndex(label);
        for (size_t frame = run_start; frame < i; ++frame)
            result.scores[frame][column] = confidence;
    }

    // Carving windows on the ground, skipping windows with synthesized frames
    const size_t carving_column = labelIndex("carving");
    for (size_t start = 0; start + kCarvingWindow < series.size(); start += kCarvingStep)
    {
        const size_t end = start + kCarvingWindow;
        bool usable = true;
        double min_angle = features[start].board_angle;
        double max_angle = features[start].board_angle;
        for (size_t frame = start; frame < end; ++frame)
        {
            if (features[frame].airborne || series[frame].interpolated || !PoseFeatures::hasFullTopology(series[frame]))
            {
                usable = false;
                break;
            }
            min_angle = std::min(min_angle, features[frame].board_angle);
            max_angle = std::max(max_angle, features[frame].board_angle);
        }
        const double range = max_angle - min_angle;
        if (!usable || range <= kCarvingAngleRange)
            continue;

        const double confidence = std::min(0.9, 0.5 + range / 100.0);
        for (size_t frame = start; frame < end; ++frame)
            result.scores[frame][carving_column] = std::max(result.scores[frame][carving_column], confidence);
    }

    // Whatever is left is straight riding
    const size_t neutral_column = labelIndex("straight_ride");
    for (auto &row : result.scores)
    {
        double strongest = *std::max_element(row.begin(), row.end());
        row[neutral_column] = strongest > 0.0 ? 0.0 : 1.0;
    }
    return result;
}
