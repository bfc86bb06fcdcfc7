#include "core/pose_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

PoseEstimator::PoseEstimator(const PoseConfig &config) : config_(config) {}

PoseEstimate PoseEstimator::estimate(const SampledFrame &frame)
{
    std::vector<Keypoint> keypoints = detectKeypoints(frame.image);
    validateKeypoints(keypoints, frame.frame_index);

    size_t confident = 0;
    for (const auto &keypoint : keypoints)
    {
        if (keypoint.confidence >= config_.min_joint_confidence)
            ++confident;
    }

    double ratio = static_cast<double>(confident) / static_cast<double>(keypoints.size());
    if (ratio < config_.min_confident_joint_ratio)
    {
        LowConfidenceMarker marker;
        marker.frame_index = frame.frame_index;
        marker.timestamp_ms = frame.timestamp_ms;
        marker.confident_joints = confident;
        return marker;
    }

    PoseFrame pose;
    pose.frame_index = frame.frame_index;
    pose.timestamp_ms = frame.timestamp_ms;
    pose.keypoints = std::move(keypoints);
    pose.interpolated = false;
    return pose;
}

void PoseEstimator::validateKeypoints(const std::vector<Keypoint> &keypoints, size_t frame_index) const
{
    if (keypoints.size() != config_.joint_count)
    {
        throw InferenceError("pose model returned " + std::to_string(keypoints.size()) + " joints at frame " +
                             std::to_string(frame_index) + ", expected " + std::to_string(config_.joint_count));
    }
    for (size_t joint = 0; joint < keypoints.size(); ++joint)
    {
        const Keypoint &keypoint = keypoints[joint];
        if (!std::isfinite(keypoint.x) || !std::isfinite(keypoint.y) || !std::isfinite(keypoint.confidence))
        {
            throw InferenceError("pose model returned a non-finite value for joint " + std::to_string(joint) +
                                 " at frame " + std::to_string(frame_index));
        }
    }
}

HeatmapPoseEstimator::HeatmapPoseEstimator(const PoseConfig &config) : PoseEstimator(config)
{
    if (config.model_path.empty())
        throw std::runtime_error("pose.model_path is not configured");
    try
    {
        net_ = cv::dnn::readNet(config.model_path);
    }
    catch (const cv::Exception &e)
    {
        throw std::runtime_error("could not load pose model '" + config.model_path + "': " + e.what());
    }
    if (net_.empty())
        throw std::runtime_error("pose model '" + config.model_path + "' is empty");
    Logger::info("Loaded pose model: " + config.model_path);
}

std::vector<Keypoint> HeatmapPoseEstimator::detectKeypoints(const cv::Mat &image)
{
    cv::Mat blob = cv::dnn::blobFromImage(image, 1.0 / 255.0,
                                          cv::Size(config().input_width, config().input_height),
                                          cv::Scalar(), true, false);
    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(net_mutex_);
        try
        {
            net_.setInput(blob);
            output = net_.forward().clone();
        }
        catch (const cv::Exception &e)
        {
            throw InferenceError(std::string("pose model forward pass failed: ") + e.what());
        }
    }
    return decodeHeatmaps(output, config().joint_count);
}

std::vector<Keypoint> HeatmapPoseEstimator::decodeHeatmaps(const cv::Mat &heatmaps, size_t joint_count)
{
    if (heatmaps.dims != 4 || heatmaps.size[0] < 1)
        throw InferenceError("pose model output must be a [1, J, H, W] blob, got " +
                             std::to_string(heatmaps.dims) + " dimensions");
    if (heatmaps.type() != CV_32F)
        throw InferenceError("pose model output must be 32-bit float");

    const int channels = heatmaps.size[1];
    const int height = heatmaps.size[2];
    const int width = heatmaps.size[3];
    if (static_cast<size_t>(channels) < joint_count)
        throw InferenceError("pose model output has " + std::to_string(channels) + " channels, expected " +
                             std::to_string(joint_count));
    if (height < 1 || width < 1)
        throw InferenceError("pose model output has an empty heatmap");

    std::vector<Keypoint> keypoints;
    keypoints.reserve(joint_count);
    for (size_t joint = 0; joint < joint_count; ++joint)
    {
        const float *plane = heatmaps.ptr<float>(0, static_cast<int>(joint));
        cv::Mat heatmap(height, width, CV_32F, const_cast<float *>(plane));

        double peak = 0.0;
        cv::Point location;
        cv::minMaxLoc(heatmap, nullptr, &peak, nullptr, &location);
        if (!std::isfinite(peak))
            throw InferenceError("pose model heatmap " + std::to_string(joint) + " contains non-finite values");

        keypoints.emplace_back((location.x + 0.5) / width, (location.y + 0.5) / height,
                               std::clamp(peak, 0.0, 1.0));
    }
    return keypoints;
}
