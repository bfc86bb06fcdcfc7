#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

/**
 * @brief One clip being encoded, frame by frame
 */
class ClipWriter
{
public:
    virtual ~ClipWriter() = default;

    /**
     * @throws RenderError when the frame cannot be encoded
     */
    virtual void write(const cv::Mat &frame) = 0;

    /**
     * @brief Finalize the container
     * @return Encoded clip bytes
     * @throws RenderError when the clip cannot be finalized
     */
    virtual std::vector<uint8_t> finish() = 0;
};

class ClipEncoder
{
public:
    virtual ~ClipEncoder() = default;

    /**
     * @throws RenderError when no writer can be opened
     */
    virtual std::unique_ptr<ClipWriter> open(const cv::Size &frame_size, double fps) = 0;
};

/**
 * @brief Motion-JPEG in AVI through cv::VideoWriter
 *
 * cv::VideoWriter only writes to files, so each clip goes through a scratch
 * file under temp_dir that is removed once its bytes are read back.
 */
class MjpegClipEncoder : public ClipEncoder
{
public:
    explicit MjpegClipEncoder(std::filesystem::path temp_dir = std::filesystem::temp_directory_path());

    std::unique_ptr<ClipWriter> open(const cv::Size &frame_size, double fps) override;

private:
    std::filesystem::path temp_dir_;
};
