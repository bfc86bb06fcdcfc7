#include "core/pose_assembler.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace
{
    size_t frameIndexOf(const PoseEstimate &estimate)
    {
        if (const auto *pose = std::get_if<PoseFrame>(&estimate))
            return pose->frame_index;
        return std::get<LowConfidenceMarker>(estimate).frame_index;
    }

    double timestampOf(const PoseEstimate &estimate)
    {
        if (const auto *pose = std::get_if<PoseFrame>(&estimate))
            return pose->timestamp_ms;
        return std::get<LowConfidenceMarker>(estimate).timestamp_ms;
    }

    PoseFrame zeroedFrame(size_t frame_index, double timestamp_ms, size_t joint_count)
    {
        PoseFrame frame;
        frame.frame_index = frame_index;
        frame.timestamp_ms = timestamp_ms;
        frame.keypoints.assign(joint_count, Keypoint(0.0, 0.0, 0.0));
        frame.interpolated = true;
        return frame;
    }

    PoseFrame interpolatedFrame(const PoseFrame &before, const PoseFrame &after, size_t frame_index, double timestamp_ms)
    {
        const double t = static_cast<double>(frame_index - before.frame_index) /
                         static_cast<double>(after.frame_index - before.frame_index);
        PoseFrame frame;
        frame.frame_index = frame_index;
        frame.timestamp_ms = timestamp_ms;
        frame.interpolated = true;
        frame.keypoints.reserve(before.keypoints.size());
        for (size_t joint = 0; joint < before.keypoints.size(); ++joint)
        {
            const Keypoint &a = before.keypoints[joint];
            const Keypoint &b = after.keypoints[joint];
            frame.keypoints.emplace_back(a.x + (b.x - a.x) * t,
                                         a.y + (b.y - a.y) * t,
                                         a.confidence + (b.confidence - a.confidence) * t);
        }
        return frame;
    }
}

std::vector<PoseFrame> PoseAssembler::assemble(const std::vector<PoseEstimate> &estimates, size_t joint_count)
{
    for (size_t i = 0; i < estimates.size(); ++i)
    {
        if (frameIndexOf(estimates[i]) != i)
            throw std::invalid_argument("pose estimates must be numbered 0..N-1, found frame " +
                                        std::to_string(frameIndexOf(estimates[i])) + " at position " +
                                        std::to_string(i));
    }

    std::vector<PoseFrame> series;
    series.reserve(estimates.size());

    std::optional<size_t> previous_anchor;
    size_t i = 0;
    while (i < estimates.size())
    {
        if (const auto *pose = std::get_if<PoseFrame>(&estimates[i]))
        {
            series.push_back(*pose);
            previous_anchor = i;
            ++i;
            continue;
        }

        size_t run_end = i;
        while (run_end < estimates.size() && std::holds_alternative<LowConfidenceMarker>(estimates[run_end]))
            ++run_end;

        const bool bracketed = previous_anchor.has_value() && run_end < estimates.size();
        for (size_t gap = i; gap < run_end; ++gap)
        {
            if (bracketed)
            {
                series.push_back(interpolatedFrame(std::get<PoseFrame>(estimates[*previous_anchor]),
                                                   std::get<PoseFrame>(estimates[run_end]), gap,
                                                   timestampOf(estimates[gap])));
            }
            else
            {
                series.push_back(zeroedFrame(gap, timestampOf(estimates[gap]), joint_count));
            }
        }
        i = run_end;
    }
    return series;
}

size_t PoseAssembler::countInterpolated(const std::vector<PoseFrame> &series)
{
    size_t count = 0;
    for (const auto &frame : series)
    {
        if (frame.interpolated)
            ++count;
    }
    return count;
}
