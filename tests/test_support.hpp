#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include "core/analysis_config.hpp"
#include "core/analysis_types.hpp"
#include "core/artifact_store.hpp"
#include "core/clip_encoder.hpp"
#include "core/frame_sampler.hpp"
#include "core/notifier.hpp"
#include "core/pipeline_errors.hpp"
#include "core/pose_estimator.hpp"
#include "core/trick_segmenter.hpp"

// Deterministic stand-ins for the model- and codec-backed collaborators

namespace test_support
{
    /**
     * @brief 33 confident keypoints of an upright rider, offset horizontally by dx
     */
    inline std::vector<Keypoint> standingPose(double dx = 0.0, double confidence = 0.9)
    {
        std::vector<Keypoint> keypoints(33, Keypoint(0.5 + dx, 0.5, confidence));
        auto set = [&](size_t joint, double x, double y)
        { keypoints[joint] = Keypoint(x + dx, y, confidence); };
        set(0, 0.50, 0.20);  // nose
        set(11, 0.45, 0.30); // shoulders
        set(12, 0.55, 0.30);
        set(13, 0.42, 0.40); // elbows
        set(14, 0.58, 0.40);
        set(15, 0.40, 0.50); // wrists
        set(16, 0.60, 0.50);
        set(23, 0.46, 0.55); // hips
        set(24, 0.54, 0.55);
        set(25, 0.45, 0.70); // knees
        set(26, 0.55, 0.70);
        set(27, 0.44, 0.85); // ankles
        set(28, 0.56, 0.85);
        set(31, 0.42, 0.88); // feet
        set(32, 0.58, 0.88);
        return keypoints;
    }

    inline std::vector<Keypoint> unconfidentPose()
    {
        return standingPose(0.0, 0.1);
    }

    /**
     * @brief Fully detected series of still poses
     */
    inline std::vector<PoseFrame> stillSeries(size_t frames)
    {
        std::vector<PoseFrame> series;
        for (size_t i = 0; i < frames; ++i)
        {
            PoseFrame frame;
            frame.frame_index = i;
            frame.timestamp_ms = static_cast<double>(i) * 1000.0 / 15.0;
            frame.keypoints = standingPose();
            series.push_back(frame);
        }
        return series;
    }

    inline VideoBytes fakeVideo()
    {
        return std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{'v', 'i', 'd', 'e', 'o'});
    }

    /**
     * @brief One-shot latch a test can open from another thread
     */
    class Gate
    {
    public:
        void open()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = true;
            }
            cv_.notify_all();
        }

        bool waitFor(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [this]
                                { return open_; });
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool open_ = false;
    };

    /**
     * @brief Sampler yielding frame_count tiny frames that carry their own index
     */
    class SyntheticFrameSampler : public FrameSampler
    {
    public:
        explicit SyntheticFrameSampler(size_t frame_count) : frame_count_(frame_count) {}

        std::function<void()> before_sample; // May throw to simulate decode failures

        std::unique_ptr<FrameSequence> sample(const VideoBytes &, double target_fps) const override
        {
            if (before_sample)
                before_sample();
            return std::make_unique<Sequence>(frame_count_, target_fps);
        }

    private:
        class Sequence : public FrameSequence
        {
        public:
            Sequence(size_t frame_count, double fps) : frame_count_(frame_count), fps_(fps) {}

            std::optional<SampledFrame> next() override
            {
                if (next_ >= frame_count_)
                    return std::nullopt;
                SampledFrame frame;
                frame.frame_index = next_;
                frame.timestamp_ms = static_cast<double>(next_) * 1000.0 / fps_;
                frame.image = cv::Mat(1, 1, CV_32SC1, cv::Scalar(static_cast<int>(next_)));
                ++next_;
                return frame;
            }

        private:
            size_t frame_count_;
            double fps_;
            size_t next_ = 0;
        };

        size_t frame_count_;
    };

    /**
     * @brief Estimator whose keypoints come from a per-frame script
     *
     * The frame index is read back from the synthetic frame image.
     */
    class ScriptedPoseEstimator : public PoseEstimator
    {
    public:
        using Script = std::function<std::vector<Keypoint>(size_t frame_index)>;

        ScriptedPoseEstimator(const PoseConfig &config, Script script)
            : PoseEstimator(config), script_(std::move(script)) {}

        // When set, the first call reports entry and blocks until the gate opens
        std::shared_ptr<Gate> entered = std::make_shared<Gate>();
        std::shared_ptr<Gate> release;

        size_t calls() const { return calls_.load(); }

    protected:
        std::vector<Keypoint> detectKeypoints(const cv::Mat &image) override
        {
            if (calls_.fetch_add(1) == 0)
            {
                entered->open();
                if (release)
                    release->waitFor(std::chrono::seconds(10));
            }
            return script_(static_cast<size_t>(image.at<int>(0, 0)));
        }

    private:
        Script script_;
        std::atomic<size_t> calls_{0};
    };

    /**
     * @brief Trick model returning one scripted label run over a neutral background
     */
    class ScriptedTrickModel : public TrickModel
    {
    public:
        ScriptedTrickModel(std::string label, size_t start, size_t end, double confidence)
            : label_(std::move(label)), start_(start), end_(end), confidence_(confidence) {}

        std::optional<size_t> nan_at_frame;

        FrameLabelScores predict(const std::vector<PoseFrame> &series) override
        {
            FrameLabelScores scores;
            scores.labels = {"straight_ride", label_};
            for (size_t frame = 0; frame < series.size(); ++frame)
            {
                double score = frame >= start_ && frame < end_ ? confidence_ : 0.0;
                std::vector<double> row{1.0 - score, score};
                if (nan_at_frame && *nan_at_frame == frame)
                    row[1] = std::numeric_limits<double>::quiet_NaN();
                scores.scores.push_back(row);
            }
            return scores;
        }

    private:
        std::string label_;
        size_t start_;
        size_t end_;
        double confidence_;
    };

    /**
     * @brief Encoder that counts frames instead of compressing them
     */
    class InMemoryClipEncoder : public ClipEncoder
    {
    public:
        std::atomic<int> failures_remaining{0}; // Leading open() calls that fail with RenderError
        std::atomic<int> opened{0};
        std::chrono::milliseconds per_frame_delay{0};

        // The first finish() opens finishing, then blocks on release_finish when set
        std::shared_ptr<Gate> finishing = std::make_shared<Gate>();
        std::shared_ptr<Gate> release_finish;

        std::unique_ptr<ClipWriter> open(const cv::Size &frame_size, double) override
        {
            ++opened;
            if (failures_remaining.fetch_sub(1) > 0)
                throw RenderError("simulated encoder failure");
            return std::make_unique<Writer>(*this, frame_size, per_frame_delay);
        }

    private:
        void onFinish()
        {
            if (finished_.fetch_add(1) != 0)
                return;
            finishing->open();
            if (release_finish)
                release_finish->waitFor(std::chrono::seconds(10));
        }

        std::atomic<int> finished_{0};

        class Writer : public ClipWriter
        {
        public:
            Writer(InMemoryClipEncoder &owner, const cv::Size &size, std::chrono::milliseconds delay)
                : owner_(owner), size_(size), delay_(delay) {}

            void write(const cv::Mat &frame) override
            {
                if (frame.size() != size_ || frame.type() != CV_8UC3)
                    throw RenderError("frame does not match the clip format");
                if (delay_.count() > 0)
                    std::this_thread::sleep_for(delay_);
                ++frames_;
            }

            std::vector<uint8_t> finish() override
            {
                owner_.onFinish();
                std::string text = "CLIP " + std::to_string(frames_);
                return std::vector<uint8_t>(text.begin(), text.end());
            }

        private:
            InMemoryClipEncoder &owner_;
            cv::Size size_;
            std::chrono::milliseconds delay_;
            size_t frames_ = 0;
        };
    };

    struct NotificationRecord
    {
        std::string user_id;
        std::string event;
        nlohmann::json payload;
    };

    class RecordingNotifier : public Notifier
    {
    public:
        void notify(const std::string &user_id, const std::string &event, const nlohmann::json &payload) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back({user_id, event, payload});
        }

        std::vector<NotificationRecord> records() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return records_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<NotificationRecord> records_;
    };

    /**
     * @brief Store decorator remembering every key that was written
     */
    class RecordingArtifactStore : public ArtifactStore
    {
    public:
        explicit RecordingArtifactStore(std::shared_ptr<ArtifactStore> inner) : inner_(std::move(inner)) {}

        std::string put(const std::string &key, const std::vector<uint8_t> &bytes) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                written_.push_back(key);
            }
            return inner_->put(key, bytes);
        }
        std::vector<uint8_t> get(const std::string &ref) const override { return inner_->get(ref); }
        std::string presign(const std::string &ref) const override { return inner_->presign(ref); }
        bool exists(const std::string &ref) const override { return inner_->exists(ref); }
        uint64_t size(const std::string &ref) const override { return inner_->size(ref); }
        size_t removePrefix(const std::string &prefix) override { return inner_->removePrefix(prefix); }

        bool wasWritten(const std::string &key) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &written : written_)
            {
                if (written == key)
                    return true;
            }
            return false;
        }

    private:
        std::shared_ptr<ArtifactStore> inner_;
        mutable std::mutex mutex_;
        std::vector<std::string> written_;
    };

    /**
     * @brief Store decorator failing the leading put() calls for matching keys
     */
    class FlakyArtifactStore : public ArtifactStore
    {
    public:
        FlakyArtifactStore(std::shared_ptr<ArtifactStore> inner, std::string key_suffix, int failures)
            : inner_(std::move(inner)), key_suffix_(std::move(key_suffix)), failures_(failures) {}

        std::string put(const std::string &key, const std::vector<uint8_t> &bytes) override
        {
            bool matches = key.size() >= key_suffix_.size() &&
                           key.compare(key.size() - key_suffix_.size(), key_suffix_.size(), key_suffix_) == 0;
            if (matches && failures_.fetch_sub(1) > 0)
                throw TransientIOError("simulated storage hiccup writing " + key);
            return inner_->put(key, bytes);
        }
        std::vector<uint8_t> get(const std::string &ref) const override { return inner_->get(ref); }
        std::string presign(const std::string &ref) const override { return inner_->presign(ref); }
        bool exists(const std::string &ref) const override { return inner_->exists(ref); }
        uint64_t size(const std::string &ref) const override { return inner_->size(ref); }
        size_t removePrefix(const std::string &prefix) override { return inner_->removePrefix(prefix); }

    private:
        std::shared_ptr<ArtifactStore> inner_;
        std::string key_suffix_;
        std::atomic<int> failures_;
    };
}
