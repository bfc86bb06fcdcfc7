#include "core/artifact_store.hpp"
#include "core/clip_encoder.hpp"
#include "core/frame_sampler.hpp"
#include "core/heuristic_trick_model.hpp"
#include "core/json_serialization.hpp"
#include "core/notifier.hpp"
#include "core/pipeline_errors.hpp"
#include "core/pipeline_orchestrator.hpp"
#include "core/pose_estimator.hpp"
#include "core/server_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "core/task_queue.hpp"
#include "database/job_database.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace
{
    struct CliOptions
    {
        std::string config_path;
        std::string style = "default";
        std::string user_id = "cli";
        std::string model_path;
        std::vector<std::string> videos;
    };

    struct SubmittedVideo
    {
        std::string path;
        std::string job_id;
        std::string rejection; // Set when submit refused the video
    };

    void printUsage(const char *program)
    {
        std::cout << "Reride analysis server" << std::endl;
        std::cout << "Usage: " << program << " [options] VIDEO..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE    Load configuration from FILE instead of ./config.yaml" << std::endl;
        std::cout << "  --style NAME     Style profile to analyze with (default: default)" << std::endl;
        std::cout << "  --user ID        User id that receives notifications (default: cli)" << std::endl;
        std::cout << "  --model FILE     ONNX pose heatmap model, overrides pose.model_path" << std::endl;
        std::cout << "  --help, -h       Show this help message" << std::endl;
    }

    // Returns false when the arguments are unusable
    bool parseArguments(int argc, char *argv[], CliOptions &options, bool &show_help)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto takeValue = [&](std::string &target) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--help" || arg == "-h")
            {
                show_help = true;
                return true;
            }
            else if (arg == "--config")
            {
                if (!takeValue(options.config_path))
                    return false;
            }
            else if (arg == "--style")
            {
                if (!takeValue(options.style))
                    return false;
            }
            else if (arg == "--user")
            {
                if (!takeValue(options.user_id))
                    return false;
            }
            else if (arg == "--model")
            {
                if (!takeValue(options.model_path))
                    return false;
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                return false;
            }
            else
            {
                options.videos.push_back(arg);
            }
        }
        if (options.videos.empty())
        {
            std::cerr << "Error: no video given" << std::endl;
            return false;
        }
        return true;
    }

    std::vector<uint8_t> readFile(const std::string &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw ValidationError("cannot open " + path);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::string uploadKey(const std::string &path, size_t index)
    {
        auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
        return "uploads/" + std::to_string(stamp) + "-" + std::to_string(index) + "-" +
               std::filesystem::path(path).filename().string();
    }

    bool allTerminal(const PipelineOrchestrator &orchestrator, const std::vector<SubmittedVideo> &videos,
                     std::map<std::string, JobStatusReport> &last_seen)
    {
        bool done = true;
        for (const auto &video : videos)
        {
            if (video.job_id.empty())
                continue;
            auto status = orchestrator.getStatus(video.job_id);
            if (!status)
                continue;
            auto previous = last_seen.find(video.job_id);
            if (previous == last_seen.end() || !(previous->second == *status))
            {
                Logger::info(video.job_id + ": " + JobStatuses::getStatusName(status->status) + " " +
                             std::to_string(status->progress) + "%");
                last_seen[video.job_id] = *status;
            }
            if (!JobStatuses::isTerminal(status->status))
                done = false;
        }
        return done;
    }
}

int main(int argc, char *argv[])
{
    CliOptions options;
    bool show_help = false;
    if (!parseArguments(argc, argv, options, show_help))
    {
        printUsage(argv[0]);
        return 2;
    }
    if (show_help)
    {
        printUsage(argv[0]);
        return 0;
    }

    ShutdownManager::getInstance().installSignalHandlers();

    auto &config_manager = ServerConfigManager::getInstance();
    if (!options.config_path.empty() && !config_manager.loadConfig(options.config_path))
    {
        std::cerr << "Error: could not load configuration from " << options.config_path << std::endl;
        return 2;
    }
    Logger::init(config_manager.getLogLevel());

    AnalysisConfig config = config_manager.getAnalysisConfig();
    if (!options.model_path.empty())
        config.pose.model_path = options.model_path;

    PipelineComponents components;
    std::shared_ptr<FileSystemArtifactStore> store;
    try
    {
        store = std::make_shared<FileSystemArtifactStore>(config.storage.root, config.storage.public_base_url,
                                                          config.storage.presign_secret,
                                                          config.storage.presign_expiry_seconds);
        components.sampler = std::make_shared<FfmpegFrameSampler>(config.sampling.max_frame_width);
        components.estimator = std::make_shared<HeatmapPoseEstimator>(config.pose);
        components.trick_model = std::make_shared<HeuristicTrickModel>();
        components.encoder = std::make_shared<MjpegClipEncoder>();
        components.store = store;
        components.queue = std::make_shared<ThreadPoolTaskQueue>(static_cast<size_t>(config.worker_threads));
        components.notifier = std::make_shared<LogNotifier>();
        if (config.database.enabled)
            components.database = std::make_shared<JobDatabase>(config.database.path);
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to initialize the analysis pipeline: " + std::string(e.what()));
        return 1;
    }

    PipelineOrchestrator orchestrator(config, components);
    if (components.database)
        orchestrator.restoreFromDatabase();

    ShutdownManager::getInstance().onShutdown("cancel outstanding jobs", [&orchestrator]()
                                              {
        size_t cancelled = orchestrator.cancelAll();
        Logger::info("Cancelled " + std::to_string(cancelled) + " outstanding jobs"); });

    std::vector<SubmittedVideo> videos;
    for (size_t i = 0; i < options.videos.size(); i++)
    {
        SubmittedVideo video;
        video.path = options.videos[i];
        try
        {
            std::string ref = store->put(uploadKey(video.path, i), readFile(video.path));
            video.job_id = orchestrator.submit(ref, options.user_id, options.style);
        }
        catch (const PipelineError &e)
        {
            video.rejection = e.describe();
            Logger::error("Rejected " + video.path + ": " + video.rejection);
        }
        videos.push_back(video);
    }

    std::map<std::string, JobStatusReport> last_seen;
    while (!allTerminal(orchestrator, videos, last_seen))
    {
        // Once shutdown is requested the jobs are cancelled; keep polling until they settle
        if (ShutdownManager::getInstance().waitForShutdownFor(std::chrono::milliseconds(200)))
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    orchestrator.waitForIdle();

    nlohmann::json report = nlohmann::json::array();
    bool all_completed = true;
    for (const auto &video : videos)
    {
        nlohmann::json entry{{"video", video.path}};
        if (video.job_id.empty())
        {
            entry["status"] = "rejected";
            entry["error_message"] = video.rejection;
            all_completed = false;
            report.push_back(entry);
            continue;
        }

        entry["job_id"] = video.job_id;
        auto status = orchestrator.getStatus(video.job_id);
        if (status)
        {
            entry.update(nlohmann::json(*status));
            if (status->status != JobStatus::COMPLETED)
                all_completed = false;
        }
        if (auto result = orchestrator.getResult(video.job_id))
            entry["result"] = *result;
        if (auto urls = orchestrator.presignArtifacts(video.job_id))
            entry["artifacts"] = {{"animation_url", urls->animation_url}, {"highlight_url", urls->highlight_url}};
        report.push_back(entry);
    }

    std::cout << report.dump(2) << std::endl;
    return all_completed ? 0 : 1;
}
