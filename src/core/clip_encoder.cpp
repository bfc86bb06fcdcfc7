#include "core/clip_encoder.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <utility>
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

namespace
{
    std::string uniqueClipName()
    {
        static std::atomic<uint64_t> counter{0};
        std::random_device device;
        std::ostringstream name;
        name << "reride-clip-" << std::hex << device() << "-" << counter.fetch_add(1) << ".avi";
        return name.str();
    }

    class MjpegClipWriter : public ClipWriter
    {
    public:
        MjpegClipWriter(std::filesystem::path path, const cv::Size &frame_size, double fps)
            : path_(std::move(path)), frame_size_(frame_size)
        {
            bool opened = false;
            try
            {
                opened = writer_.open(path_.string(), cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, frame_size_, true);
            }
            catch (const cv::Exception &e)
            {
                throw RenderError("could not open clip writer: " + std::string(e.what()));
            }
            if (!opened || !writer_.isOpened())
                throw RenderError("could not open MJPG clip writer at " + path_.string());
        }

        ~MjpegClipWriter() override
        {
            if (writer_.isOpened())
                writer_.release();
            removeScratchFile();
        }

        void write(const cv::Mat &frame) override
        {
            if (finished_)
                throw RenderError("clip already finished");
            if (frame.size() != frame_size_ || frame.type() != CV_8UC3)
                throw RenderError("frame does not match the clip format");
            try
            {
                writer_.write(frame);
            }
            catch (const cv::Exception &e)
            {
                throw RenderError("failed to encode frame: " + std::string(e.what()));
            }
            ++frames_written_;
        }

        std::vector<uint8_t> finish() override
        {
            if (finished_)
                throw RenderError("clip already finished");
            finished_ = true;
            writer_.release();
            if (frames_written_ == 0)
                throw RenderError("clip has no frames");

            std::ifstream file(path_, std::ios::binary);
            if (!file.is_open())
                throw RenderError("could not read encoded clip " + path_.string());
            std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            file.close();
            removeScratchFile();

            if (bytes.empty())
                throw RenderError("encoder produced an empty clip");
            return bytes;
        }

    private:
        void removeScratchFile()
        {
            std::error_code ec;
            if (std::filesystem::exists(path_, ec) && !std::filesystem::remove(path_, ec) && ec)
                Logger::warn("Could not remove scratch clip " + path_.string() + ": " + ec.message());
        }

        std::filesystem::path path_;
        cv::Size frame_size_;
        cv::VideoWriter writer_;
        size_t frames_written_ = 0;
        bool finished_ = false;
    };
}

MjpegClipEncoder::MjpegClipEncoder(std::filesystem::path temp_dir) : temp_dir_(std::move(temp_dir)) {}

std::unique_ptr<ClipWriter> MjpegClipEncoder::open(const cv::Size &frame_size, double fps)
{
    if (frame_size.width <= 0 || frame_size.height <= 0 || !(fps > 0.0))
        throw RenderError("invalid clip format " + std::to_string(frame_size.width) + "x" +
                          std::to_string(frame_size.height) + " @ " + std::to_string(fps) + " fps");
    return std::make_unique<MjpegClipWriter>(temp_dir_ / uniqueClipName(), frame_size, fps);
}
