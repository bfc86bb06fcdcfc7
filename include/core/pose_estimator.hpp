#pragma once

#include <cstddef>
#include <mutex>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"
#include "core/frame_sampler.hpp"

/**
 * @brief Emitted instead of a PoseFrame when too few joints were detected
 */
struct LowConfidenceMarker
{
    size_t frame_index = 0;
    double timestamp_ms = 0.0;
    size_t confident_joints = 0;
};

using PoseEstimate = std::variant<PoseFrame, LowConfidenceMarker>;

/**
 * @brief Maps a frame to a skeletal keypoint set
 *
 * Subclasses run the actual model in detectKeypoints(); this base validates
 * the model output and applies the confidence policy. It never synthesizes
 * keypoints: low-confidence frames come back as a LowConfidenceMarker.
 */
class PoseEstimator
{
public:
    explicit PoseEstimator(const PoseConfig &config);
    virtual ~PoseEstimator() = default;

    /**
     * @brief Estimate the pose of one sampled frame
     * @throws InferenceError when the model output is malformed
     */
    PoseEstimate estimate(const SampledFrame &frame);

    const PoseConfig &config() const { return config_; }

protected:
    /**
     * @brief Run the model on a BGR image
     * @return One keypoint per joint in normalized image coordinates
     */
    virtual std::vector<Keypoint> detectKeypoints(const cv::Mat &image) = 0;

private:
    void validateKeypoints(const std::vector<Keypoint> &keypoints, size_t frame_index) const;

    PoseConfig config_;
};

/**
 * @brief Runs an ONNX heatmap model (output [1, J, H, W]) through OpenCV DNN
 */
class HeatmapPoseEstimator : public PoseEstimator
{
public:
    /**
     * @throws std::runtime_error when the model cannot be loaded
     */
    explicit HeatmapPoseEstimator(const PoseConfig &config);

    /**
     * @brief Decode a 4D heatmap blob by per-channel arg-max
     * @param heatmaps Network output of shape [1, J, H, W]
     * @param joint_count Number of channels to decode
     * @throws InferenceError when the blob is not 4D or has too few channels
     */
    static std::vector<Keypoint> decodeHeatmaps(const cv::Mat &heatmaps, size_t joint_count);

protected:
    std::vector<Keypoint> detectKeypoints(const cv::Mat &image) override;

private:
    cv::dnn::Net net_;
    std::mutex net_mutex_; // cv::dnn::Net::forward is not re-entrant
};
