#include "core/animation_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <opencv2/imgproc.hpp>
#include "core/pipeline_errors.hpp"
#include "core/pose_features.hpp"
#include "logging/logger.hpp"

namespace
{
    /**
     * @brief Source joints feeding one character joint; a != b takes the midpoint
     */
    struct JointCorrespondence
    {
        CharacterJoint target;
        size_t source_a;
        size_t source_b;
    };

    const std::array<JointCorrespondence, kCharacterJointCount> kCorrespondence = {{
        {CharacterJoint::HEAD, NOSE, NOSE},
        {CharacterJoint::NECK, LEFT_SHOULDER, RIGHT_SHOULDER},
        {CharacterJoint::PELVIS, LEFT_HIP, RIGHT_HIP},
        {CharacterJoint::LEFT_SHOULDER, LEFT_SHOULDER, LEFT_SHOULDER},
        {CharacterJoint::RIGHT_SHOULDER, RIGHT_SHOULDER, RIGHT_SHOULDER},
        {CharacterJoint::LEFT_ELBOW, LEFT_ELBOW, LEFT_ELBOW},
        {CharacterJoint::RIGHT_ELBOW, RIGHT_ELBOW, RIGHT_ELBOW},
        {CharacterJoint::LEFT_WRIST, LEFT_WRIST, LEFT_WRIST},
        {CharacterJoint::RIGHT_WRIST, RIGHT_WRIST, RIGHT_WRIST},
        {CharacterJoint::LEFT_HIP, LEFT_HIP, LEFT_HIP},
        {CharacterJoint::RIGHT_HIP, RIGHT_HIP, RIGHT_HIP},
        {CharacterJoint::LEFT_KNEE, LEFT_KNEE, LEFT_KNEE},
        {CharacterJoint::RIGHT_KNEE, RIGHT_KNEE, RIGHT_KNEE},
        {CharacterJoint::LEFT_ANKLE, LEFT_ANKLE, LEFT_ANKLE},
        {CharacterJoint::RIGHT_ANKLE, RIGHT_ANKLE, RIGHT_ANKLE},
        {CharacterJoint::LEFT_FOOT, LEFT_FOOT, LEFT_FOOT},
        {CharacterJoint::RIGHT_FOOT, RIGHT_FOOT, RIGHT_FOOT},
    }};

    cv::Scalar toBgr(const Rgb &color)
    {
        return cv::Scalar(color.b, color.g, color.r);
    }

    cv::Scalar darken(const Rgb &color, int amount)
    {
        return cv::Scalar(std::max(0, color.b - amount), std::max(0, color.g - amount), std::max(0, color.r - amount));
    }

    const cv::Point2d &jointOf(const CharacterPose &pose, CharacterJoint joint)
    {
        return pose[static_cast<size_t>(joint)];
    }
}

AnimationRenderer::AnimationRenderer(std::shared_ptr<ClipEncoder> encoder, const RenderingConfig &config)
    : encoder_(std::move(encoder)), config_(config)
{
    if (!encoder_)
        throw std::invalid_argument("AnimationRenderer requires a clip encoder");
}

CharacterPose AnimationRenderer::retarget(const PoseFrame &frame)
{
    CharacterPose pose;
    pose.fill(cv::Point2d(0.0, 0.0));
    if (!PoseFeatures::hasFullTopology(frame))
        return pose;

    for (const auto &mapping : kCorrespondence)
    {
        const Keypoint &a = frame.keypoints[mapping.source_a];
        const Keypoint &b = frame.keypoints[mapping.source_b];
        pose[static_cast<size_t>(mapping.target)] = cv::Point2d((a.x + b.x) / 2.0, (a.y + b.y) / 2.0);
    }
    return pose;
}

std::vector<CharacterPose> AnimationRenderer::smooth(const std::vector<PoseFrame> &series) const
{
    std::vector<CharacterPose> smoothed;
    smoothed.reserve(series.size());
    for (size_t i = 0; i < series.size(); ++i)
    {
        CharacterPose raw = retarget(series[i]);
        if (i == 0)
        {
            smoothed.push_back(raw);
            continue;
        }
        const double alpha = series[i].interpolated ? config_.interpolated_smoothing : config_.detected_smoothing;
        const CharacterPose &previous = smoothed.back();
        CharacterPose next;
        for (size_t joint = 0; joint < kCharacterJointCount; ++joint)
            next[joint] = raw[joint] * alpha + previous[joint] * (1.0 - alpha);
        smoothed.push_back(next);
    }
    return smoothed;
}

std::vector<size_t> AnimationRenderer::highlightFrames(const std::vector<TrickSegment> &segments,
                                                      size_t frame_count, size_t margin, size_t max_frames)
{
    std::vector<size_t> frames;
    if (frame_count == 0 || max_frames == 0)
        return frames;

    if (segments.empty())
    {
        const size_t step = std::max<size_t>(1, frame_count / max_frames);
        for (size_t i = 0; i < frame_count && frames.size() < max_frames; i += step)
            frames.push_back(i);
        return frames;
    }

    double best = 0.0;
    for (const auto &segment : segments)
        best = std::max(best, segment.confidence);

    std::vector<bool> selected(frame_count, false);
    for (const auto &segment : segments)
    {
        if (std::fabs(segment.confidence - best) > 1e-9)
            continue;
        const size_t first = segment.start_frame > margin ? segment.start_frame - margin : 0;
        const size_t last = std::min(frame_count, segment.end_frame + margin);
        for (size_t i = first; i < last; ++i)
            selected[i] = true;
    }

    for (size_t i = 0; i < frame_count && frames.size() < max_frames; ++i)
    {
        if (selected[i])
            frames.push_back(i);
    }
    return frames;
}

cv::Mat AnimationRenderer::drawFrame(const CharacterPose &pose, const CharacterPalette &palette,
                                     size_t frame_number, bool airborne) const
{
    const int width = config_.width;
    const int height = config_.height;
    cv::Mat canvas(height, width, CV_8UC3, toBgr(palette.background));

    // Sky gradient over the upper half
    const int sky_rows = std::max(1, height / 2);
    for (int y = 0; y < sky_rows; ++y)
    {
        double ratio = static_cast<double>(y) / sky_rows;
        cv::Scalar shade(palette.background.b, palette.background.g * (1.0 - ratio * 0.2),
                         palette.background.r * (1.0 - ratio * 0.3));
        cv::line(canvas, cv::Point(0, y), cv::Point(width - 1, y), shade, 1);
    }

    // Snow slope with moving texture lines
    const int slope_y = height * 2 / 3;
    std::vector<cv::Point> slope = {{0, slope_y}, {width, slope_y - height / 14}, {width, height}, {0, height}};
    cv::fillConvexPoly(canvas, slope, toBgr(palette.snow), cv::LINE_AA);
    for (int i = 0; i < 5; ++i)
    {
        int offset = slope_y + i * (height / 24) + static_cast<int>(frame_number % 20);
        cv::line(canvas, cv::Point(0, offset), cv::Point(width, offset - height / 36), darken(palette.snow, 15), 1,
                 cv::LINE_AA);
    }

    const double margin_x = width * 0.14;
    const double margin_y = height * 0.14;
    auto toCanvas = [&](CharacterJoint joint)
    {
        const cv::Point2d &p = jointOf(pose, joint);
        return cv::Point(static_cast<int>(margin_x + p.x * (width - 2 * margin_x)),
                         static_cast<int>(margin_y + p.y * (height - 2 * margin_y)));
    };
    auto limb = [&](CharacterJoint from, CharacterJoint to, const Rgb &color, int thickness)
    {
        cv::line(canvas, toCanvas(from), toCanvas(to), toBgr(color), thickness, cv::LINE_AA);
        cv::circle(canvas, toCanvas(from), thickness / 2, toBgr(color), cv::FILLED, cv::LINE_AA);
        cv::circle(canvas, toCanvas(to), thickness / 2, toBgr(color), cv::FILLED, cv::LINE_AA);
    };

    // Board between the feet, extended past them
    cv::Point2d left_foot = toCanvas(CharacterJoint::LEFT_FOOT);
    cv::Point2d right_foot = toCanvas(CharacterJoint::RIGHT_FOOT);
    cv::Point2d direction = right_foot - left_foot;
    double length = std::hypot(direction.x, direction.y);
    if (length >= 1.0)
    {
        direction *= 1.0 / length;
        cv::Point2d normal(-direction.y * 5.0, direction.x * 5.0);
        cv::Point2d tail = left_foot - direction * 20.0;
        cv::Point2d nose = right_foot + direction * 20.0;
        std::vector<cv::Point> board = {tail + normal, nose + normal, nose - normal, tail - normal};
        cv::fillConvexPoly(canvas, board, toBgr(palette.board), cv::LINE_AA);
        cv::circle(canvas, tail, 5, toBgr(palette.board), cv::FILLED, cv::LINE_AA);
        cv::circle(canvas, nose, 5, toBgr(palette.board), cv::FILLED, cv::LINE_AA);
    }

    limb(CharacterJoint::LEFT_HIP, CharacterJoint::LEFT_KNEE, palette.pants, 9);
    limb(CharacterJoint::LEFT_KNEE, CharacterJoint::LEFT_ANKLE, palette.pants, 7);
    limb(CharacterJoint::RIGHT_HIP, CharacterJoint::RIGHT_KNEE, palette.pants, 9);
    limb(CharacterJoint::RIGHT_KNEE, CharacterJoint::RIGHT_ANKLE, palette.pants, 7);

    cv::Point neck = toCanvas(CharacterJoint::NECK);
    cv::Point pelvis = toCanvas(CharacterJoint::PELVIS);
    const int body = palette.body_width;
    std::vector<cv::Point> torso = {{neck.x - body, neck.y}, {neck.x + body, neck.y},
                                    {pelvis.x + body - 3, pelvis.y}, {pelvis.x - body + 3, pelvis.y}};
    cv::fillConvexPoly(canvas, torso, toBgr(palette.body), cv::LINE_AA);

    limb(CharacterJoint::LEFT_SHOULDER, CharacterJoint::LEFT_ELBOW, palette.body, 7);
    limb(CharacterJoint::LEFT_ELBOW, CharacterJoint::LEFT_WRIST, palette.body, 5);
    limb(CharacterJoint::RIGHT_SHOULDER, CharacterJoint::RIGHT_ELBOW, palette.body, 7);
    limb(CharacterJoint::RIGHT_ELBOW, CharacterJoint::RIGHT_WRIST, palette.body, 5);
    cv::circle(canvas, toCanvas(CharacterJoint::LEFT_WRIST), 6, toBgr(palette.pants), cv::FILLED, cv::LINE_AA);
    cv::circle(canvas, toCanvas(CharacterJoint::RIGHT_WRIST), 6, toBgr(palette.pants), cv::FILLED, cv::LINE_AA);

    // Helmet with goggles
    cv::Point head = toCanvas(CharacterJoint::HEAD);
    const int radius = palette.head_radius;
    cv::circle(canvas, head, radius, toBgr(palette.helmet), cv::FILLED, cv::LINE_AA);
    cv::rectangle(canvas, cv::Point(head.x - radius + 3, head.y - 8), cv::Point(head.x + radius - 3, head.y + 5),
                  toBgr(palette.goggle), cv::FILLED, cv::LINE_AA);

    if (airborne)
    {
        for (int i = 0; i < 6; ++i)
        {
            double angle = ((frame_number * 30 + i * 60) % 360) * 3.14159265358979323846 / 180.0;
            double distance = 34.0 + static_cast<double>((frame_number * 3 + i * 7) % 24);
            cv::Point spark(pelvis.x + static_cast<int>(std::cos(angle) * distance),
                            pelvis.y + static_cast<int>(std::sin(angle) * distance));
            cv::circle(canvas, spark, 3, toBgr(palette.goggle), cv::FILLED, cv::LINE_AA);
        }
    }
    return canvas;
}

RenderedClips AnimationRenderer::render(const std::vector<PoseFrame> &series, const std::vector<TrickSegment> &segments,
                                        const StyleProfile &style, const StageDeadline *deadline,
                                        const CancellationToken *token) const
{
    if (series.empty())
        throw RenderError("pose series is empty");

    const std::vector<CharacterPose> poses = smooth(series);
    const std::vector<FrameFeatures> features = PoseFeatures::compute(series);

    RenderedClips clips;
    const size_t max_highlight_frames =
        std::max<size_t>(1, static_cast<size_t>(config_.highlight_max_seconds * config_.fps));
    clips.highlight_frames =
        highlightFrames(segments, series.size(), config_.highlight_margin_frames, max_highlight_frames);

    const cv::Size frame_size(config_.width, config_.height);
    std::unique_ptr<ClipWriter> animation = encoder_->open(frame_size, config_.fps);
    std::unique_ptr<ClipWriter> highlight = encoder_->open(frame_size, config_.fps);

    auto next_highlight = clips.highlight_frames.begin();
    for (size_t i = 0; i < poses.size(); ++i)
    {
        if (token)
            token->check("rendering frame " + std::to_string(i));
        if (deadline)
            deadline->check();
        try
        {
            cv::Mat frame = drawFrame(poses[i], style.palette, i, features[i].airborne);
            animation->write(frame);
            if (next_highlight != clips.highlight_frames.end() && *next_highlight == i)
            {
                highlight->write(frame);
                ++next_highlight;
            }
        }
        catch (const cv::Exception &e)
        {
            throw RenderError("failed to draw frame " + std::to_string(i) + ": " + e.what());
        }
    }

    clips.animation = animation->finish();
    clips.highlight = highlight->finish();
    Logger::debug("Rendered " + std::to_string(poses.size()) + " frames, " +
                  std::to_string(clips.highlight_frames.size()) + " in the highlight");
    return clips;
}
