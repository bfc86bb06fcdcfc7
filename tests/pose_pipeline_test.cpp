#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>
#include "core/analysis_config.hpp"
#include "core/heuristic_trick_model.hpp"
#include "core/pipeline_errors.hpp"
#include "core/pose_assembler.hpp"
#include "core/pose_estimator.hpp"
#include "core/pose_features.hpp"
#include "test_support.hpp"

using namespace test_support;

namespace
{
    SampledFrame frameNumber(size_t index)
    {
        SampledFrame frame;
        frame.frame_index = index;
        frame.timestamp_ms = static_cast<double>(index) * 100.0;
        frame.image = cv::Mat(1, 1, CV_32SC1, cv::Scalar(static_cast<int>(index)));
        return frame;
    }

    PoseFrame detected(size_t index, double dx = 0.0)
    {
        PoseFrame frame;
        frame.frame_index = index;
        frame.timestamp_ms = static_cast<double>(index) * 100.0;
        frame.keypoints = standingPose(dx);
        return frame;
    }

    LowConfidenceMarker marker(size_t index)
    {
        LowConfidenceMarker m;
        m.frame_index = index;
        m.timestamp_ms = static_cast<double>(index) * 100.0;
        return m;
    }

    // Shift every keypoint of a frame upwards in the image
    void lift(PoseFrame &frame, double amount)
    {
        for (auto &keypoint : frame.keypoints)
            keypoint.y -= amount;
    }

    std::vector<PoseFrame> seriesWithJump(size_t frames, size_t jump_start, size_t jump_end)
    {
        std::vector<PoseFrame> series = stillSeries(frames);
        for (size_t i = jump_start; i < jump_end; ++i)
            lift(series[i], 0.2);
        return series;
    }

    std::string strongestLabel(const FrameLabelScores &scores, size_t frame)
    {
        const auto &row = scores.scores[frame];
        size_t best = 0;
        for (size_t i = 1; i < row.size(); ++i)
        {
            if (row[i] > row[best])
                best = i;
        }
        return scores.labels[best];
    }
}

// ---- PoseEstimator confidence policy ----

TEST(PoseEstimatorTest, ConfidentFrameYieldsPose)
{
    ScriptedPoseEstimator estimator(PoseConfig{}, [](size_t)
                                    { return standingPose(); });
    PoseEstimate estimate = estimator.estimate(frameNumber(7));

    ASSERT_TRUE(std::holds_alternative<PoseFrame>(estimate));
    const PoseFrame &pose = std::get<PoseFrame>(estimate);
    EXPECT_EQ(pose.frame_index, 7u);
    EXPECT_DOUBLE_EQ(pose.timestamp_ms, 700.0);
    EXPECT_EQ(pose.keypoints.size(), 33u);
    EXPECT_FALSE(pose.interpolated);
}

TEST(PoseEstimatorTest, UnconfidentFrameYieldsMarker)
{
    ScriptedPoseEstimator estimator(PoseConfig{}, [](size_t)
                                    { return unconfidentPose(); });
    PoseEstimate estimate = estimator.estimate(frameNumber(3));

    ASSERT_TRUE(std::holds_alternative<LowConfidenceMarker>(estimate));
    EXPECT_EQ(std::get<LowConfidenceMarker>(estimate).frame_index, 3u);
    EXPECT_EQ(std::get<LowConfidenceMarker>(estimate).confident_joints, 0u);
}

TEST(PoseEstimatorTest, ConfidentJointRatioDecides)
{
    // 20 of 33 joints clears the 0.6 ratio, 19 of 33 does not
    auto partlyConfident = [](size_t confident)
    {
        std::vector<Keypoint> keypoints = standingPose(0.0, 0.2);
        for (size_t joint = 0; joint < confident; ++joint)
            keypoints[joint].confidence = 0.8;
        return keypoints;
    };

    ScriptedPoseEstimator enough(PoseConfig{}, [&](size_t)
                                 { return partlyConfident(20); });
    ScriptedPoseEstimator too_few(PoseConfig{}, [&](size_t)
                                  { return partlyConfident(19); });

    EXPECT_TRUE(std::holds_alternative<PoseFrame>(enough.estimate(frameNumber(0))));
    PoseEstimate rejected = too_few.estimate(frameNumber(0));
    ASSERT_TRUE(std::holds_alternative<LowConfidenceMarker>(rejected));
    EXPECT_EQ(std::get<LowConfidenceMarker>(rejected).confident_joints, 19u);
}

TEST(PoseEstimatorTest, WrongJointCountIsInferenceError)
{
    ScriptedPoseEstimator estimator(PoseConfig{}, [](size_t)
                                    { return std::vector<Keypoint>(17, Keypoint(0.5, 0.5, 0.9)); });
    EXPECT_THROW(estimator.estimate(frameNumber(0)), InferenceError);
}

TEST(PoseEstimatorTest, NonFiniteKeypointIsInferenceError)
{
    ScriptedPoseEstimator estimator(PoseConfig{}, [](size_t)
                                    {
        auto keypoints = standingPose();
        keypoints[5].x = std::numeric_limits<double>::quiet_NaN();
        return keypoints; });
    EXPECT_THROW(estimator.estimate(frameNumber(0)), InferenceError);
}

TEST(PoseEstimatorTest, HeatmapModelRequiresPath)
{
    EXPECT_THROW(HeatmapPoseEstimator(PoseConfig{}), std::runtime_error);
}

TEST(PoseEstimatorTest, DecodeHeatmapsTakesPeakPerJoint)
{
    const int sizes[] = {1, 2, 4, 8};
    cv::Mat heatmaps(4, sizes, CV_32F, cv::Scalar(0));
    heatmaps.ptr<float>(0, 0)[1 * 8 + 6] = 0.8f; // joint 0 peaks at row 1, column 6
    heatmaps.ptr<float>(0, 1)[3 * 8 + 0] = 1.7f; // joint 1 peaks above 1.0

    std::vector<Keypoint> keypoints = HeatmapPoseEstimator::decodeHeatmaps(heatmaps, 2);

    ASSERT_EQ(keypoints.size(), 2u);
    EXPECT_DOUBLE_EQ(keypoints[0].x, 6.5 / 8.0);
    EXPECT_DOUBLE_EQ(keypoints[0].y, 1.5 / 4.0);
    EXPECT_NEAR(keypoints[0].confidence, 0.8, 1e-6);
    EXPECT_DOUBLE_EQ(keypoints[1].x, 0.5 / 8.0);
    EXPECT_DOUBLE_EQ(keypoints[1].y, 3.5 / 4.0);
    EXPECT_DOUBLE_EQ(keypoints[1].confidence, 1.0);
}

TEST(PoseEstimatorTest, DecodeHeatmapsRejectsMalformedOutput)
{
    cv::Mat flat(4, 8, CV_32F, cv::Scalar(0));
    EXPECT_THROW(HeatmapPoseEstimator::decodeHeatmaps(flat, 1), InferenceError);

    const int sizes[] = {1, 2, 4, 8};
    cv::Mat too_few_channels(4, sizes, CV_32F, cv::Scalar(0));
    EXPECT_THROW(HeatmapPoseEstimator::decodeHeatmaps(too_few_channels, 33), InferenceError);

    cv::Mat wrong_depth(4, sizes, CV_8U, cv::Scalar(0));
    EXPECT_THROW(HeatmapPoseEstimator::decodeHeatmaps(wrong_depth, 2), InferenceError);
}

// ---- PoseAssembler ----

TEST(PoseAssemblerTest, AllDetectedFramesPassThrough)
{
    std::vector<PoseEstimate> estimates = {detected(0), detected(1), detected(2)};
    std::vector<PoseFrame> series = PoseAssembler::assemble(estimates, 33);

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(PoseAssembler::countInterpolated(series), 0u);
}

TEST(PoseAssemblerTest, BracketedGapIsInterpolatedLinearly)
{
    std::vector<PoseEstimate> estimates = {detected(0, 0.0), marker(1), marker(2), detected(3, 0.3)};
    std::vector<PoseFrame> series = PoseAssembler::assemble(estimates, 33);

    ASSERT_EQ(series.size(), 4u);
    EXPECT_FALSE(series[0].interpolated);
    EXPECT_TRUE(series[1].interpolated);
    EXPECT_TRUE(series[2].interpolated);
    EXPECT_FALSE(series[3].interpolated);

    // Nose x moves from 0.5 to 0.8 over three steps
    EXPECT_NEAR(series[1].keypoints[NOSE].x, 0.6, 1e-9);
    EXPECT_NEAR(series[2].keypoints[NOSE].x, 0.7, 1e-9);
    EXPECT_NEAR(series[1].keypoints[NOSE].y, 0.2, 1e-9);
    EXPECT_NEAR(series[1].keypoints[NOSE].confidence, 0.9, 1e-9);
    EXPECT_DOUBLE_EQ(series[2].timestamp_ms, 200.0);
    EXPECT_EQ(series[2].frame_index, 2u);
}

TEST(PoseAssemblerTest, UnbracketedRunsAreZeroed)
{
    std::vector<PoseEstimate> estimates = {marker(0), detected(1), marker(2), marker(3)};
    std::vector<PoseFrame> series = PoseAssembler::assemble(estimates, 33);

    ASSERT_EQ(series.size(), 4u);
    for (size_t i : {0u, 2u, 3u})
    {
        EXPECT_TRUE(series[i].interpolated) << "frame " << i;
        ASSERT_EQ(series[i].keypoints.size(), 33u);
        for (const auto &keypoint : series[i].keypoints)
        {
            EXPECT_EQ(keypoint.x, 0.0);
            EXPECT_EQ(keypoint.y, 0.0);
            EXPECT_EQ(keypoint.confidence, 0.0);
        }
    }
    EXPECT_EQ(PoseAssembler::countInterpolated(series), 3u);
}

TEST(PoseAssemblerTest, EveryFrameLowConfidence)
{
    std::vector<PoseEstimate> estimates = {marker(0), marker(1)};
    std::vector<PoseFrame> series = PoseAssembler::assemble(estimates, 33);

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(PoseAssembler::countInterpolated(series), 2u);
}

TEST(PoseAssemblerTest, RejectsMisnumberedEstimates)
{
    std::vector<PoseEstimate> estimates = {detected(0), detected(2)};
    EXPECT_THROW(PoseAssembler::assemble(estimates, 33), std::invalid_argument);
}

TEST(PoseAssemblerTest, EmptyInputGivesEmptySeries)
{
    EXPECT_TRUE(PoseAssembler::assemble({}, 33).empty());
}

// ---- PoseFeatures ----

TEST(PoseFeaturesTest, Angles)
{
    EXPECT_NEAR(PoseFeatures::jointAngle(Keypoint(1, 0, 1), Keypoint(0, 0, 1), Keypoint(0, 1, 1)), 90.0, 1e-6);
    EXPECT_NEAR(PoseFeatures::jointAngle(Keypoint(-1, 0, 1), Keypoint(0, 0, 1), Keypoint(1, 0, 1)), 180.0, 1e-6);
    EXPECT_NEAR(PoseFeatures::lineAngle(Keypoint(0, 0, 1), Keypoint(1, 0, 1)), 0.0, 1e-9);
    EXPECT_NEAR(PoseFeatures::lineAngle(Keypoint(0, 0, 1), Keypoint(0, 1, 1)), 90.0, 1e-9);
}

TEST(PoseFeaturesTest, StandingRiderStaysGrounded)
{
    std::vector<FrameFeatures> features = PoseFeatures::compute(stillSeries(10));

    ASSERT_EQ(features.size(), 10u);
    for (const auto &f : features)
    {
        EXPECT_FALSE(f.airborne);
        EXPECT_NEAR(f.center_of_mass_x, 0.5, 1e-9);
        EXPECT_NEAR(f.center_of_mass_y, 0.425, 1e-9);
        EXPECT_NEAR(f.shoulder_angle, 0.0, 1e-9);
    }
}

TEST(PoseFeaturesTest, LiftedFeetAreAirborne)
{
    std::vector<FrameFeatures> features = PoseFeatures::compute(seriesWithJump(20, 10, 15));

    for (size_t i = 0; i < features.size(); ++i)
        EXPECT_EQ(features[i].airborne, i >= 10 && i < 15) << "frame " << i;
}

TEST(PoseFeaturesTest, SynthesizedFramesAreNeverAirborne)
{
    std::vector<PoseFrame> series = seriesWithJump(20, 10, 15);
    series[12].interpolated = true;
    std::vector<FrameFeatures> features = PoseFeatures::compute(series);

    EXPECT_TRUE(features[11].airborne);
    EXPECT_FALSE(features[12].airborne);
}

// ---- HeuristicTrickModel ----

TEST(HeuristicTrickModelTest, StillRidingIsNeutral)
{
    HeuristicTrickModel model;
    FrameLabelScores scores = model.predict(stillSeries(25));

    ASSERT_EQ(scores.labels, HeuristicTrickModel::trickClasses());
    ASSERT_EQ(scores.scores.size(), 25u);
    for (size_t frame = 0; frame < 25; ++frame)
        EXPECT_EQ(strongestLabel(scores, frame), "straight_ride");
}

TEST(HeuristicTrickModelTest, StraightAirIsJump)
{
    HeuristicTrickModel model;
    FrameLabelScores scores = model.predict(seriesWithJump(20, 5, 10));

    for (size_t frame = 5; frame < 10; ++frame)
        EXPECT_EQ(strongestLabel(scores, frame), "jump_straight") << "frame " << frame;
    EXPECT_EQ(strongestLabel(scores, 4), "straight_ride");
    EXPECT_EQ(strongestLabel(scores, 10), "straight_ride");
}

TEST(HeuristicTrickModelTest, ShoulderRotationInAirIsSpin)
{
    std::vector<PoseFrame> series = seriesWithJump(20, 5, 10);
    // Shoulders swapped by the end of the air time: a half turn of the upper body
    std::swap(series[9].keypoints[LEFT_SHOULDER], series[9].keypoints[RIGHT_SHOULDER]);

    HeuristicTrickModel model;
    FrameLabelScores scores = model.predict(series);

    EXPECT_EQ(strongestLabel(scores, 7), "jump_360");
}

TEST(HeuristicTrickModelTest, HandAtFeetIsGrab)
{
    std::vector<PoseFrame> series = seriesWithJump(20, 5, 10);
    series[7].keypoints[LEFT_INDEX] = series[7].keypoints[LEFT_FOOT];

    HeuristicTrickModel model;
    FrameLabelScores scores = model.predict(series);

    EXPECT_EQ(strongestLabel(scores, 6), "grab_indy");
}

TEST(HeuristicTrickModelTest, ShortHopIsIgnored)
{
    HeuristicTrickModel model;
    FrameLabelScores scores = model.predict(seriesWithJump(20, 5, 7));

    EXPECT_EQ(strongestLabel(scores, 5), "straight_ride");
    EXPECT_EQ(strongestLabel(scores, 6), "straight_ride");
}
