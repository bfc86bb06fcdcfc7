#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"
#include "core/cancellation_token.hpp"
#include "core/clip_encoder.hpp"
#include "core/error_recovery.hpp"

/**
 * @brief Joints of the rendered character skeleton
 */
enum class CharacterJoint : size_t
{
    HEAD,
    NECK,
    PELVIS,
    LEFT_SHOULDER,
    RIGHT_SHOULDER,
    LEFT_ELBOW,
    RIGHT_ELBOW,
    LEFT_WRIST,
    RIGHT_WRIST,
    LEFT_HIP,
    RIGHT_HIP,
    LEFT_KNEE,
    RIGHT_KNEE,
    LEFT_ANKLE,
    RIGHT_ANKLE,
    LEFT_FOOT,
    RIGHT_FOOT,
    COUNT
};

constexpr size_t kCharacterJointCount = static_cast<size_t>(CharacterJoint::COUNT);

/**
 * @brief Character joint positions of one frame, normalized coordinates
 */
using CharacterPose = std::array<cv::Point2d, kCharacterJointCount>;

struct RenderedClips
{
    std::vector<uint8_t> animation;
    std::vector<uint8_t> highlight;
    std::vector<size_t> highlight_frames; // Ascending series indices written to the highlight clip
};

class AnimationRenderer
{
public:
    AnimationRenderer(std::shared_ptr<ClipEncoder> encoder, const RenderingConfig &config);

    /**
     * @brief Render the full reconstruction and the highlight clip
     * @param deadline Checked once per rendered frame when given
     * @param token Checked once per rendered frame when given
     * @throws RenderError when encoding fails
     * @throws OperationCancelledError when the token is cancelled mid-render
     */
    RenderedClips render(const std::vector<PoseFrame> &series, const std::vector<TrickSegment> &segments,
                         const StyleProfile &style, const StageDeadline *deadline = nullptr,
                         const CancellationToken *token = nullptr) const;

    /**
     * @brief Map a 33-joint source pose onto the character skeleton
     *
     * Frames without the full source topology map to the origin.
     */
    static CharacterPose retarget(const PoseFrame &frame);

    /**
     * @brief Retarget and temporally smooth a whole series
     *
     * s_t = a * raw_t + (1 - a) * s_{t-1}, with the reduced weight for
     * interpolated frames.
     */
    std::vector<CharacterPose> smooth(const std::vector<PoseFrame> &series) const;

    /**
     * @brief Series indices of the highlight clip
     *
     * The union of the highest-confidence segments (ties included), each padded
     * by margin frames and clamped to the series, truncated to max_frames.
     * Without segments the whole series is sampled evenly down to max_frames.
     * @return Ascending, duplicate-free indices
     */
    static std::vector<size_t> highlightFrames(const std::vector<TrickSegment> &segments, size_t frame_count,
                                               size_t margin, size_t max_frames);

    /**
     * @brief Draw one character frame
     */
    cv::Mat drawFrame(const CharacterPose &pose, const CharacterPalette &palette, size_t frame_number,
                      bool airborne) const;

private:
    std::shared_ptr<ClipEncoder> encoder_;
    RenderingConfig config_;
};
