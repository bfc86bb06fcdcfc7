#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

using VideoBytes = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * @brief One frame kept by the sampler
 */
struct SampledFrame
{
    size_t frame_index = 0; // Renumbered 0..N-1 over the kept frames
    double timestamp_ms = 0.0;
    cv::Mat image;          // BGR, 8 bit
};

/**
 * @brief Lazy, finite sequence of sampled frames
 */
class FrameSequence
{
public:
    virtual ~FrameSequence() = default;

    /**
     * @brief Decode up to the next kept frame
     * @return The frame, or std::nullopt once the sequence is exhausted
     * @throws DecodeError when the stream cannot be decoded
     * @throws EmptyVideoError when the sequence ends without producing a frame
     */
    virtual std::optional<SampledFrame> next() = 0;
};

class FrameSampler
{
public:
    virtual ~FrameSampler() = default;

    /**
     * @brief Open a sampled view of the video
     *
     * Each call starts again from the first frame of the input.
     * @param video_bytes Complete container bytes
     * @param target_fps Desired sampling rate
     * @throws DecodeError when the container or codec cannot be opened
     */
    virtual std::unique_ptr<FrameSequence> sample(const VideoBytes &video_bytes, double target_fps) const = 0;
};

/**
 * @brief FFmpeg-backed sampler reading the container straight from memory
 *
 * Keeps every k-th decoded frame with k = max(1, floor(source_fps / target_fps))
 * and downscales frames wider than max_frame_width.
 */
class FfmpegFrameSampler : public FrameSampler
{
public:
    explicit FfmpegFrameSampler(int max_frame_width = 640);

    std::unique_ptr<FrameSequence> sample(const VideoBytes &video_bytes, double target_fps) const override;

    /**
     * @brief Sampling stride for the given rates
     */
    static size_t computeStride(double source_fps, double target_fps);

private:
    int max_frame_width_;
};
