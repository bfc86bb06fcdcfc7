#pragma once
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libswscale/swscale.h>
}

/**
 * @brief Human-readable text for an FFmpeg error code
 */
inline std::string ffmpegErrorString(int error_code)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf) + " (error code: " + std::to_string(error_code) + ")";
}

// RAII wrapper for FFmpeg AVFormatContext
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    // Allow move
    AVCodecContextRAII(AVCodecContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(nullptr) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }

    void set(AVFrame *new_frame)
    {
        if (frame_)
            av_frame_free(&frame_);
        frame_ = new_frame;
    }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

    // Allow move
    AVFrameRAII(AVFrameRAII &&other) noexcept : frame_(other.frame_)
    {
        other.frame_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(nullptr) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }

    void set(AVPacket *new_packet)
    {
        if (packet_)
            av_packet_free(&packet_);
        packet_ = new_packet;
    }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

    // Allow move
    AVPacketRAII(AVPacketRAII &&other) noexcept : packet_(other.packet_)
    {
        other.packet_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwsContext
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() { return ctx_; }
    void set(SwsContext *c) { ctx_ = c; }

    // Hand ownership back, e.g. to sws_getCachedContext which frees or reuses it
    SwsContext *release()
    {
        SwsContext *released = ctx_;
        ctx_ = nullptr;
        return released;
    }

    // Disable copy
    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

    // Allow move
    SwsContextRAII(SwsContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

/**
 * @brief Read cursor over an in-memory container, fed to FFmpeg through AVIO
 */
struct MemoryReadCursor
{
    const uint8_t *data = nullptr;
    size_t size = 0;
    size_t position = 0;

    static int readPacket(void *opaque, uint8_t *buf, int buf_size)
    {
        auto *cursor = static_cast<MemoryReadCursor *>(opaque);
        size_t remaining = cursor->size - cursor->position;
        if (remaining == 0)
            return AVERROR_EOF;
        size_t to_copy = remaining < static_cast<size_t>(buf_size) ? remaining : static_cast<size_t>(buf_size);
        std::memcpy(buf, cursor->data + cursor->position, to_copy);
        cursor->position += to_copy;
        return static_cast<int>(to_copy);
    }

    static int64_t seek(void *opaque, int64_t offset, int whence)
    {
        auto *cursor = static_cast<MemoryReadCursor *>(opaque);
        int64_t base = 0;
        switch (whence & ~AVSEEK_FORCE)
        {
        case AVSEEK_SIZE:
            return static_cast<int64_t>(cursor->size);
        case SEEK_SET:
            base = 0;
            break;
        case SEEK_CUR:
            base = static_cast<int64_t>(cursor->position);
            break;
        case SEEK_END:
            base = static_cast<int64_t>(cursor->size);
            break;
        default:
            return AVERROR(EINVAL);
        }
        int64_t target = base + offset;
        if (target < 0 || target > static_cast<int64_t>(cursor->size))
            return AVERROR(EINVAL);
        cursor->position = static_cast<size_t>(target);
        return target;
    }
};

// RAII wrapper for a read-only custom AVIOContext and its buffer
class AVIOContextRAII
{
private:
    AVIOContext *ctx_;

public:
    AVIOContextRAII() : ctx_(nullptr) {}
    ~AVIOContextRAII()
    {
        if (ctx_)
        {
            av_freep(&ctx_->buffer);
            avio_context_free(&ctx_);
        }
    }

    /**
     * @brief Allocate the context reading from cursor
     * @return false when FFmpeg could not allocate the buffer or context
     */
    bool open(MemoryReadCursor *cursor, int buffer_size = 64 * 1024)
    {
        auto *buffer = static_cast<unsigned char *>(av_malloc(buffer_size));
        if (!buffer)
            return false;
        ctx_ = avio_alloc_context(buffer, buffer_size, 0, cursor, &MemoryReadCursor::readPacket, nullptr,
                                  &MemoryReadCursor::seek);
        if (!ctx_)
        {
            av_free(buffer);
            return false;
        }
        return true;
    }

    AVIOContext *get() { return ctx_; }

    // Disable copy
    AVIOContextRAII(const AVIOContextRAII &) = delete;
    AVIOContextRAII &operator=(const AVIOContextRAII &) = delete;
};
