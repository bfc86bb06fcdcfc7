#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>

/**
 * @brief RGB color triple used by the character palettes
 */
struct Rgb
{
    int r = 0;
    int g = 0;
    int b = 0;
};

/**
 * @brief Colors of the rendered rider and scene
 */
struct CharacterPalette
{
    Rgb body{70, 130, 220};
    Rgb pants{50, 50, 60};
    Rgb board{220, 50, 50};
    Rgb helmet{255, 255, 255};
    Rgb goggle{255, 165, 0};
    Rgb background{200, 230, 255};
    Rgb snow{240, 245, 255};
    int head_radius = 18;
    int body_width = 14;
};

/**
 * @brief Style-dependent parameters, resolved once at submission and
 * threaded through every stage of the job
 */
struct StyleProfile
{
    std::string name = "default";
    std::set<std::string> preferred_labels; // Win ties inside the epsilon band
    std::map<std::string, double> trick_weights;
    CharacterPalette palette;

    bool prefers(const std::string &label) const { return preferred_labels.count(label) > 0; }
};

struct SamplingConfig
{
    double target_fps = 15.0;
    int max_frame_width = 640;
};

struct PoseConfig
{
    size_t joint_count = 33;
    double min_joint_confidence = 0.5;
    double min_confident_joint_ratio = 0.6;
    int input_width = 256;
    int input_height = 256;
    std::string model_path; // ONNX heatmap model, empty disables the built-in estimator
};

struct SegmentationConfig
{
    std::string neutral_label = "straight_ride";
    double detection_threshold = 0.5;
    size_t min_segment_frames = 5;
    double tie_epsilon = 0.05;
};

struct ScoringConfig
{
    size_t stability_window = 15;
    double stability_sensitivity = 20000.0;
    double stability_weight = 0.4;
    double difficulty_weight = 0.3;
    double coverage_weight = 0.3;
    double default_trick_weight = 20.0;
    double low_stability_cutoff = 50.0;
    double low_coverage_cutoff = 0.6;
};

struct RenderingConfig
{
    int width = 480;
    int height = 480;
    double fps = 15.0;
    double detected_smoothing = 0.6;
    double interpolated_smoothing = 0.25;
    size_t highlight_margin_frames = 5;
    double highlight_max_seconds = 15.0;
};

struct RetryConfig
{
    int transient_attempts = 3;
    int transient_base_delay_ms = 100;
    int render_attempts = 2;
};

/**
 * @brief Wall-clock budget per stage, in seconds
 */
struct TimeoutConfig
{
    double extracting_seconds = 120.0;
    double estimating_pose_seconds = 600.0;
    double classifying_seconds = 120.0;
    double scoring_seconds = 60.0;
    double rendering_seconds = 300.0;
};

struct StorageConfig
{
    std::string root = "./storage";
    std::string public_base_url = "http://localhost:8080/artifacts";
    std::string presign_secret = "change-me";
    int presign_expiry_seconds = 3600;
    int max_video_size_mb = 100;
};

struct DatabaseConfig
{
    bool enabled = false;
    std::string path = "reride.db";
};

/**
 * @brief Typed view of the analysis section of config.yaml
 */
struct AnalysisConfig
{
    int worker_threads = 4;
    SamplingConfig sampling;
    PoseConfig pose;
    SegmentationConfig segmentation;
    ScoringConfig scoring;
    RenderingConfig rendering;
    RetryConfig retry;
    TimeoutConfig timeouts;
    StorageConfig storage;
    DatabaseConfig database;
    std::map<std::string, StyleProfile> styles;

    /**
     * @brief Look up a style profile by name
     * @return The profile, or std::nullopt when the style is unknown
     */
    std::optional<StyleProfile> resolveStyle(const std::string &name) const
    {
        auto it = styles.find(name);
        if (it == styles.end())
            return std::nullopt;
        return it->second;
    }

    static std::map<std::string, double> defaultTrickWeights()
    {
        return {
            {"straight_ride", 0.0},
            {"ollie", 15.0},
            {"nollie", 18.0},
            {"jump_straight", 20.0},
            {"jump_180", 35.0},
            {"jump_360", 55.0},
            {"grab_indy", 40.0},
            {"grab_mute", 40.0},
            {"rail_50_50", 35.0},
            {"rail_boardslide", 45.0},
            {"butter", 20.0},
            {"carving", 15.0}};
    }

    /**
     * @brief Built-in configuration with every known style registered
     */
    static AnalysisConfig defaults();
};
