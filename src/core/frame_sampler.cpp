#include "core/frame_sampler.hpp"
#include <cmath>
#include <string>
#include <utility>
#include "core/external_library_wrappers.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"

namespace
{
    class FfmpegFrameSequence : public FrameSequence
    {
    public:
        FfmpegFrameSequence(VideoBytes video_bytes, double target_fps, int max_frame_width)
            : video_bytes_(std::move(video_bytes)), target_fps_(target_fps), max_frame_width_(max_frame_width)
        {
            open();
        }

        std::optional<SampledFrame> next() override
        {
            while (!finished_)
            {
                int response = avcodec_receive_frame(codec_ctx_.get(), frame_.get());
                if (response == 0)
                {
                    size_t decoded_index = decoded_count_++;
                    if (decoded_index % stride_ == 0)
                    {
                        SampledFrame sampled = convertFrame(decoded_index);
                        av_frame_unref(frame_.get());
                        return sampled;
                    }
                    av_frame_unref(frame_.get());
                    continue;
                }
                if (response == AVERROR_EOF)
                {
                    finished_ = true;
                    break;
                }
                if (response != AVERROR(EAGAIN))
                {
                    throw DecodeError("failed to decode video frame: " + ffmpegErrorString(response));
                }
                if (draining_)
                {
                    finished_ = true;
                    break;
                }
                feedDecoder();
            }

            if (produced_count_ == 0)
            {
                if (rejected_packets_ > 0)
                    throw DecodeError("no packet of the video stream could be decoded (" +
                                      std::to_string(rejected_packets_) + " rejected)");
                throw EmptyVideoError("video produced no frames");
            }
            return std::nullopt;
        }

    private:
        void open()
        {
            cursor_.data = video_bytes_->data();
            cursor_.size = video_bytes_->size();
            if (!avio_ctx_.open(&cursor_))
                throw DecodeError("could not allocate AVIO context");

            AVFormatContext *raw_format = avformat_alloc_context();
            if (!raw_format)
                throw DecodeError("could not allocate format context");
            raw_format->pb = avio_ctx_.get();
            raw_format->flags |= AVFMT_FLAG_CUSTOM_IO;
            *format_ctx_.address() = raw_format;

            // avformat_open_input frees the context on failure
            int open_result = avformat_open_input(format_ctx_.address(), nullptr, nullptr, nullptr);
            if (open_result < 0)
                throw DecodeError("could not open video container: " + ffmpegErrorString(open_result));

            int stream_info_result = avformat_find_stream_info(format_ctx_.get(), nullptr);
            if (stream_info_result < 0)
                throw DecodeError("could not find stream information: " + ffmpegErrorString(stream_info_result));

            stream_index_ = av_find_best_stream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
            if (stream_index_ < 0)
                throw DecodeError("no video stream found");

            AVStream *video_stream = format_ctx_.get()->streams[stream_index_];
            AVCodecParameters *codec_params = video_stream->codecpar;
            const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
            if (!codec)
                throw DecodeError("unsupported video codec");

            codec_ctx_.set(avcodec_alloc_context3(codec));
            if (!codec_ctx_.get())
                throw DecodeError("could not allocate decoder context");
            if (avcodec_parameters_to_context(codec_ctx_.get(), codec_params) < 0)
                throw DecodeError("could not copy codec parameters");
            int codec_open_result = avcodec_open2(codec_ctx_.get(), codec, nullptr);
            if (codec_open_result < 0)
                throw DecodeError("could not open decoder: " + ffmpegErrorString(codec_open_result));

            frame_.set(av_frame_alloc());
            packet_.set(av_packet_alloc());
            if (!frame_.get() || !packet_.get())
                throw DecodeError("could not allocate frame or packet");

            time_base_ = av_q2d(video_stream->time_base);
            start_time_ = video_stream->start_time != AV_NOPTS_VALUE ? video_stream->start_time : 0;
            source_fps_ = av_q2d(video_stream->avg_frame_rate);
            if (!(source_fps_ > 0.0))
                source_fps_ = av_q2d(video_stream->r_frame_rate);
            stride_ = FfmpegFrameSampler::computeStride(source_fps_, target_fps_);

            Logger::debug("Video info - FPS: " + std::to_string(source_fps_) + ", size: " +
                          std::to_string(codec_ctx_.get()->width) + "x" + std::to_string(codec_ctx_.get()->height) +
                          ", sampling stride: " + std::to_string(stride_));
        }

        void feedDecoder()
        {
            while (true)
            {
                int read_result = av_read_frame(format_ctx_.get(), packet_.get());
                if (read_result < 0)
                {
                    if (read_result != AVERROR_EOF)
                        Logger::warn("Stopped reading video early: " + ffmpegErrorString(read_result));
                    int flush_result = avcodec_send_packet(codec_ctx_.get(), nullptr);
                    if (flush_result < 0 && flush_result != AVERROR_EOF)
                        Logger::warn("Could not flush decoder: " + ffmpegErrorString(flush_result));
                    draining_ = true;
                    return;
                }
                if (packet_.get()->stream_index != stream_index_)
                {
                    av_packet_unref(packet_.get());
                    continue;
                }
                int send_result = avcodec_send_packet(codec_ctx_.get(), packet_.get());
                av_packet_unref(packet_.get());
                if (send_result < 0 && send_result != AVERROR(EAGAIN))
                {
                    ++rejected_packets_;
                    Logger::debug("Decoder rejected packet: " + ffmpegErrorString(send_result));
                    continue;
                }
                return;
            }
        }

        SampledFrame convertFrame(size_t decoded_index)
        {
            AVFrame *frame = frame_.get();
            int out_width = frame->width;
            int out_height = frame->height;
            if (max_frame_width_ > 0 && out_width > max_frame_width_)
            {
                out_height = static_cast<int>(std::lround(static_cast<double>(out_height) * max_frame_width_ / out_width));
                out_width = max_frame_width_;
                if (out_height < 1)
                    out_height = 1;
            }

            sws_ctx_.set(sws_getCachedContext(sws_ctx_.release(), frame->width, frame->height,
                                              static_cast<AVPixelFormat>(frame->format), out_width, out_height,
                                              AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr));
            if (!sws_ctx_.get())
                throw DecodeError("could not create scaler context");

            SampledFrame sampled;
            sampled.image = cv::Mat(out_height, out_width, CV_8UC3);
            uint8_t *dst_data[4] = {sampled.image.data, nullptr, nullptr, nullptr};
            int dst_linesize[4] = {static_cast<int>(sampled.image.step[0]), 0, 0, 0};
            sws_scale(sws_ctx_.get(), frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);

            sampled.frame_index = produced_count_++;
            if (frame->best_effort_timestamp != AV_NOPTS_VALUE)
            {
                sampled.timestamp_ms = static_cast<double>(frame->best_effort_timestamp - start_time_) * time_base_ * 1000.0;
            }
            else if (source_fps_ > 0.0)
            {
                sampled.timestamp_ms = static_cast<double>(decoded_index) / source_fps_ * 1000.0;
            }
            else
            {
                sampled.timestamp_ms = static_cast<double>(sampled.frame_index) / target_fps_ * 1000.0;
            }
            return sampled;
        }

        VideoBytes video_bytes_;
        double target_fps_;
        int max_frame_width_;

        // Declared before the format context so it outlives it
        MemoryReadCursor cursor_;
        AVIOContextRAII avio_ctx_;
        AVFormatContextRAII format_ctx_;
        AVCodecContextRAII codec_ctx_;
        AVFrameRAII frame_;
        AVPacketRAII packet_;
        SwsContextRAII sws_ctx_;

        int stream_index_ = -1;
        double time_base_ = 0.0;
        int64_t start_time_ = 0;
        double source_fps_ = 0.0;
        size_t stride_ = 1;
        size_t decoded_count_ = 0;
        size_t produced_count_ = 0;
        size_t rejected_packets_ = 0;
        bool draining_ = false;
        bool finished_ = false;
    };
}

FfmpegFrameSampler::FfmpegFrameSampler(int max_frame_width) : max_frame_width_(max_frame_width) {}

size_t FfmpegFrameSampler::computeStride(double source_fps, double target_fps)
{
    if (!(source_fps > 0.0) || !(target_fps > 0.0) || !std::isfinite(source_fps))
        return 1;
    double ratio = std::floor(source_fps / target_fps);
    return ratio < 1.0 ? 1 : static_cast<size_t>(ratio);
}

std::unique_ptr<FrameSequence> FfmpegFrameSampler::sample(const VideoBytes &video_bytes, double target_fps) const
{
    if (!video_bytes || video_bytes->empty())
        throw DecodeError("video is empty");
    if (!(target_fps > 0.0))
        throw DecodeError("target fps must be positive");
    return std::make_unique<FfmpegFrameSequence>(video_bytes, target_fps, max_frame_width_);
}
