#include "core/server_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <stdexcept>

namespace
{
    const char *const kDefaultConfigYaml = R"(
        log_level: "INFO"
        threading:
          worker_threads: 4
        sampling:
          target_fps: 15
          max_frame_width: 640
        pose:
          joint_count: 33
          min_joint_confidence: 0.5
          min_confident_joint_ratio: 0.6
          input_width: 256
          input_height: 256
          model_path: ""
        segmentation:
          neutral_label: "straight_ride"
          detection_threshold: 0.5
          min_segment_frames: 5
          tie_epsilon: 0.05
        scoring:
          stability_window: 15
          stability_sensitivity: 20000
          stability_weight: 0.4
          difficulty_weight: 0.3
          coverage_weight: 0.3
          default_trick_weight: 20
          low_stability_cutoff: 50
          low_coverage_cutoff: 0.6
        rendering:
          width: 480
          height: 480
          fps: 15
          detected_smoothing: 0.6
          interpolated_smoothing: 0.25
          highlight_margin_frames: 5
          highlight_max_seconds: 15
        retry:
          transient_attempts: 3
          transient_base_delay_ms: 100
          render_attempts: 2
        timeouts:
          extracting_seconds: 120
          estimating_pose_seconds: 600
          classifying_seconds: 120
          scoring_seconds: 60
          rendering_seconds: 300
        storage:
          root: "./storage"
          public_base_url: "http://localhost:8080/artifacts"
          presign_secret: "change-me"
          presign_expiry_seconds: 3600
          max_video_size_mb: 100
        database:
          enabled: false
          path: "reride.db"
        styles:
          default: {}
          park:
            preferred_labels: [jump_straight, jump_180, jump_360, grab_indy, grab_mute]
          carving:
            preferred_labels: [carving, butter]
            trick_weights:
              carving: 25
              butter: 25
          rail:
            preferred_labels: [rail_50_50, rail_boardslide]
          neon:
            palette:
              body: [0, 255, 128]
              pants: [30, 30, 40]
              board: [255, 0, 255]
              helmet: [0, 200, 255]
              goggle: [255, 255, 0]
              background: [20, 20, 40]
              snow: [40, 40, 60]
          retro:
            palette:
              body: [200, 100, 50]
              pants: [80, 60, 40]
              board: [60, 120, 60]
              helmet: [220, 200, 170]
              goggle: [150, 80, 50]
              background: [180, 210, 230]
              snow: [230, 235, 240]
    )";

    template <typename T>
    void readValue(const YAML::Node &section, const char *key, T &target)
    {
        if (section && section[key])
            target = section[key].as<T>();
    }

    void readColor(const YAML::Node &palette, const char *key, Rgb &target)
    {
        if (!palette || !palette[key])
            return;
        const YAML::Node &value = palette[key];
        if (!value.IsSequence() || value.size() != 3)
            throw std::invalid_argument(std::string("palette color '") + key + "' must be a list of 3 integers");
        target.r = value[0].as<int>();
        target.g = value[1].as<int>();
        target.b = value[2].as<int>();
        for (int channel : {target.r, target.g, target.b})
        {
            if (channel < 0 || channel > 255)
                throw std::invalid_argument(std::string("palette color '") + key + "' out of range");
        }
    }

    StyleProfile parseStyle(const std::string &name, const YAML::Node &node)
    {
        StyleProfile style;
        style.name = name;
        style.trick_weights = AnalysisConfig::defaultTrickWeights();

        if (node && node["preferred_labels"])
        {
            for (const auto &label : node["preferred_labels"])
                style.preferred_labels.insert(label.as<std::string>());
        }
        if (node && node["trick_weights"])
        {
            for (auto it = node["trick_weights"].begin(); it != node["trick_weights"].end(); ++it)
            {
                double weight = it->second.as<double>();
                if (weight < 0.0)
                    throw std::invalid_argument("negative trick weight for '" + it->first.as<std::string>() +
                                                "' in style '" + name + "'");
                style.trick_weights[it->first.as<std::string>()] = weight;
            }
        }
        if (node && node["palette"])
        {
            const YAML::Node palette = node["palette"];
            readColor(palette, "body", style.palette.body);
            readColor(palette, "pants", style.palette.pants);
            readColor(palette, "board", style.palette.board);
            readColor(palette, "helmet", style.palette.helmet);
            readColor(palette, "goggle", style.palette.goggle);
            readColor(palette, "background", style.palette.background);
            readColor(palette, "snow", style.palette.snow);
        }
        return style;
    }

    void requireUnit(double value, const std::string &name)
    {
        if (value < 0.0 || value > 1.0)
            throw std::invalid_argument(name + " must be within [0, 1], got " + std::to_string(value));
    }

    void requirePositive(double value, const std::string &name)
    {
        if (!(value > 0.0))
            throw std::invalid_argument(name + " must be positive, got " + std::to_string(value));
    }

    void validateAnalysisConfig(const AnalysisConfig &config)
    {
        if (config.worker_threads < 1 || config.worker_threads > 64)
            throw std::invalid_argument("threading.worker_threads must be within 1-64, got " +
                                        std::to_string(config.worker_threads));

        requirePositive(config.sampling.target_fps, "sampling.target_fps");
        requirePositive(config.sampling.max_frame_width, "sampling.max_frame_width");

        requirePositive(static_cast<double>(config.pose.joint_count), "pose.joint_count");
        requireUnit(config.pose.min_joint_confidence, "pose.min_joint_confidence");
        requireUnit(config.pose.min_confident_joint_ratio, "pose.min_confident_joint_ratio");
        requirePositive(config.pose.input_width, "pose.input_width");
        requirePositive(config.pose.input_height, "pose.input_height");

        if (config.segmentation.neutral_label.empty())
            throw std::invalid_argument("segmentation.neutral_label must not be empty");
        requireUnit(config.segmentation.detection_threshold, "segmentation.detection_threshold");
        requireUnit(config.segmentation.tie_epsilon, "segmentation.tie_epsilon");
        requirePositive(static_cast<double>(config.segmentation.min_segment_frames), "segmentation.min_segment_frames");

        requirePositive(static_cast<double>(config.scoring.stability_window), "scoring.stability_window");
        requirePositive(config.scoring.stability_sensitivity, "scoring.stability_sensitivity");
        for (double weight : {config.scoring.stability_weight, config.scoring.difficulty_weight,
                              config.scoring.coverage_weight, config.scoring.default_trick_weight})
        {
            if (weight < 0.0)
                throw std::invalid_argument("scoring weights must be non-negative");
        }
        requireUnit(config.scoring.low_coverage_cutoff, "scoring.low_coverage_cutoff");

        requirePositive(config.rendering.width, "rendering.width");
        requirePositive(config.rendering.height, "rendering.height");
        requirePositive(config.rendering.fps, "rendering.fps");
        requirePositive(config.rendering.highlight_max_seconds, "rendering.highlight_max_seconds");
        requireUnit(config.rendering.detected_smoothing, "rendering.detected_smoothing");
        requireUnit(config.rendering.interpolated_smoothing, "rendering.interpolated_smoothing");

        requirePositive(config.retry.transient_attempts, "retry.transient_attempts");
        requirePositive(config.retry.render_attempts, "retry.render_attempts");
        if (config.retry.transient_base_delay_ms < 0)
            throw std::invalid_argument("retry.transient_base_delay_ms must not be negative");

        requirePositive(config.timeouts.extracting_seconds, "timeouts.extracting_seconds");
        requirePositive(config.timeouts.estimating_pose_seconds, "timeouts.estimating_pose_seconds");
        requirePositive(config.timeouts.classifying_seconds, "timeouts.classifying_seconds");
        requirePositive(config.timeouts.scoring_seconds, "timeouts.scoring_seconds");
        requirePositive(config.timeouts.rendering_seconds, "timeouts.rendering_seconds");

        if (config.storage.root.empty())
            throw std::invalid_argument("storage.root must not be empty");
        requirePositive(config.storage.presign_expiry_seconds, "storage.presign_expiry_seconds");
        requirePositive(config.storage.max_video_size_mb, "storage.max_video_size_mb");

        if (config.styles.find("default") == config.styles.end())
            throw std::invalid_argument("styles must define a 'default' style");
    }
}

ServerConfigManager::ServerConfigManager()
{
    const std::string config_file = "config.yaml";

    std::ifstream file_check(config_file);
    if (!file_check.good())
    {
        Logger::info("Configuration file not found, creating default config.yaml");
        initializeDefaultConfig();
        if (saveConfig(config_file))
        {
            Logger::info("Default configuration saved to: " + config_file);
        }
        else
        {
            Logger::error("Failed to save default configuration to: " + config_file);
        }
        return;
    }
    file_check.close();

    if (!loadConfig(config_file))
    {
        Logger::error("Failed to load configuration from file, using hardcoded defaults");
        initializeDefaultConfig();
    }
}

ServerConfigManager &ServerConfigManager::getInstance()
{
    static ServerConfigManager instance;
    return instance;
}

YAML::Node ServerConfigManager::defaultConfig()
{
    return YAML::Load(kDefaultConfigYaml);
}

void ServerConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = defaultConfig();
}

std::string ServerConfigManager::getLogLevel() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (config_["log_level"])
        return config_["log_level"].as<std::string>();
    return "INFO";
}

YAML::Node ServerConfigManager::getConfig() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return YAML::Clone(config_);
}

AnalysisConfig ServerConfigManager::getAnalysisConfig() const
{
    YAML::Node snapshot = getConfig();
    try
    {
        return parseAnalysisConfig(snapshot);
    }
    catch (const std::exception &e)
    {
        Logger::error("Invalid analysis configuration, using defaults: " + std::string(e.what()));
        return AnalysisConfig::defaults();
    }
}

void ServerConfigManager::setLogLevel(const std::string &level)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::string old_level = config_["log_level"] ? config_["log_level"].as<std::string>() : "INFO";
    if (old_level == level)
        return;
    config_["log_level"] = level;
    Logger::setLevel(level);
}

AnalysisConfig ServerConfigManager::parseAnalysisConfig(const YAML::Node &config)
{
    AnalysisConfig parsed;
    try
    {
        readValue(config["threading"], "worker_threads", parsed.worker_threads);

        const YAML::Node sampling = config["sampling"];
        readValue(sampling, "target_fps", parsed.sampling.target_fps);
        readValue(sampling, "max_frame_width", parsed.sampling.max_frame_width);

        const YAML::Node pose = config["pose"];
        readValue(pose, "joint_count", parsed.pose.joint_count);
        readValue(pose, "min_joint_confidence", parsed.pose.min_joint_confidence);
        readValue(pose, "min_confident_joint_ratio", parsed.pose.min_confident_joint_ratio);
        readValue(pose, "input_width", parsed.pose.input_width);
        readValue(pose, "input_height", parsed.pose.input_height);
        readValue(pose, "model_path", parsed.pose.model_path);

        const YAML::Node segmentation = config["segmentation"];
        readValue(segmentation, "neutral_label", parsed.segmentation.neutral_label);
        readValue(segmentation, "detection_threshold", parsed.segmentation.detection_threshold);
        readValue(segmentation, "min_segment_frames", parsed.segmentation.min_segment_frames);
        readValue(segmentation, "tie_epsilon", parsed.segmentation.tie_epsilon);

        const YAML::Node scoring = config["scoring"];
        readValue(scoring, "stability_window", parsed.scoring.stability_window);
        readValue(scoring, "stability_sensitivity", parsed.scoring.stability_sensitivity);
        readValue(scoring, "stability_weight", parsed.scoring.stability_weight);
        readValue(scoring, "difficulty_weight", parsed.scoring.difficulty_weight);
        readValue(scoring, "coverage_weight", parsed.scoring.coverage_weight);
        readValue(scoring, "default_trick_weight", parsed.scoring.default_trick_weight);
        readValue(scoring, "low_stability_cutoff", parsed.scoring.low_stability_cutoff);
        readValue(scoring, "low_coverage_cutoff", parsed.scoring.low_coverage_cutoff);

        const YAML::Node rendering = config["rendering"];
        readValue(rendering, "width", parsed.rendering.width);
        readValue(rendering, "height", parsed.rendering.height);
        readValue(rendering, "fps", parsed.rendering.fps);
        readValue(rendering, "detected_smoothing", parsed.rendering.detected_smoothing);
        readValue(rendering, "interpolated_smoothing", parsed.rendering.interpolated_smoothing);
        readValue(rendering, "highlight_margin_frames", parsed.rendering.highlight_margin_frames);
        readValue(rendering, "highlight_max_seconds", parsed.rendering.highlight_max_seconds);

        const YAML::Node retry = config["retry"];
        readValue(retry, "transient_attempts", parsed.retry.transient_attempts);
        readValue(retry, "transient_base_delay_ms", parsed.retry.transient_base_delay_ms);
        readValue(retry, "render_attempts", parsed.retry.render_attempts);

        const YAML::Node timeouts = config["timeouts"];
        readValue(timeouts, "extracting_seconds", parsed.timeouts.extracting_seconds);
        readValue(timeouts, "estimating_pose_seconds", parsed.timeouts.estimating_pose_seconds);
        readValue(timeouts, "classifying_seconds", parsed.timeouts.classifying_seconds);
        readValue(timeouts, "scoring_seconds", parsed.timeouts.scoring_seconds);
        readValue(timeouts, "rendering_seconds", parsed.timeouts.rendering_seconds);

        const YAML::Node storage = config["storage"];
        readValue(storage, "root", parsed.storage.root);
        readValue(storage, "public_base_url", parsed.storage.public_base_url);
        readValue(storage, "presign_secret", parsed.storage.presign_secret);
        readValue(storage, "presign_expiry_seconds", parsed.storage.presign_expiry_seconds);
        readValue(storage, "max_video_size_mb", parsed.storage.max_video_size_mb);

        const YAML::Node database = config["database"];
        readValue(database, "enabled", parsed.database.enabled);
        readValue(database, "path", parsed.database.path);

        const YAML::Node styles = config["styles"];
        if (styles && styles.IsMap())
        {
            for (auto it = styles.begin(); it != styles.end(); ++it)
            {
                const std::string name = it->first.as<std::string>();
                parsed.styles[name] = parseStyle(name, it->second);
            }
        }
        else
        {
            parsed.styles["default"] = parseStyle("default", YAML::Node());
        }
    }
    catch (const YAML::Exception &e)
    {
        throw std::invalid_argument("malformed configuration value: " + std::string(e.what()));
    }

    validateAnalysisConfig(parsed);
    return parsed;
}

AnalysisConfig AnalysisConfig::defaults()
{
    return ServerConfigManager::parseAnalysisConfig(ServerConfigManager::defaultConfig());
}

bool ServerConfigManager::loadConfig(const std::string &file_path)
{
    try
    {
        YAML::Node loaded = YAML::LoadFile(file_path);
        if (!validateConfig(loaded))
        {
            Logger::error("Invalid configuration in file: " + file_path);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_ = loaded;
        }
        Logger::info("Configuration loaded from: " + file_path);
        if (loaded["log_level"])
            Logger::init(loaded["log_level"].as<std::string>());
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error loading config: " + std::string(e.what()));
        return false;
    }
}

bool ServerConfigManager::saveConfig(const std::string &file_path) const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return saveConfigInternal(file_path, config_);
}

bool ServerConfigManager::saveConfigInternal(const std::string &file_path, const YAML::Node &config) const
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }
        file << config;
        Logger::info("Configuration saved to: " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}

bool ServerConfigManager::validateConfig(const YAML::Node &config) const
{
    if (!config || !config.IsMap())
    {
        Logger::error("Configuration root must be a mapping");
        return false;
    }
    if (config["log_level"] && !Logger::isValidLevel(config["log_level"].as<std::string>()))
    {
        Logger::error("Invalid log level: " + config["log_level"].as<std::string>());
        return false;
    }
    try
    {
        parseAnalysisConfig(config);
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error("Invalid analysis configuration: " + std::string(e.what()));
        return false;
    }
    return true;
}
