#include "config.hpp"
#include "detection_service.hpp"
#include "errors.hpp"
#include "progress_channel.hpp"
#include "report.hpp"
#include <iostream>
#include <chrono>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH [VIDEO_PATH...]\n"
              << "Options:\n"
              << "  --config FILE        JSON configuration with the backbone manifest\n"
              << "  -f, --frames NUM     Frames to sample per video (default: 16)\n"
              << "  --high NUM           Probability at or above which a video is FAKE (default: 0.65)\n"
              << "  --low NUM            Probability at or below which a video is REAL (default: 0.35)\n"
              << "  -m, --memory NUM     Memory budget for loaded backbones in MB (default: 8192)\n"
              << "  --cpu                Force CPU inference\n"
              << "  --job-id ID          Job identifier reported in results and progress\n"
              << "  --progress           Print progress events to stderr as JSON lines\n"
              << "  --output FILE        Output JSON file\n"
              << "  --batch              Process every VIDEO_PATH given\n"
              << "  --info               Show video information only\n"
              << "  -h, --help           Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file;
    std::vector<std::string> video_paths;
    std::string output_file;
    std::string job_id;
    bool batch_mode = false;
    bool info_only = false;
    bool show_progress = false;

    std::optional<int> frames;
    std::optional<double> high_threshold;
    std::optional<double> low_threshold;
    std::optional<size_t> memory_mb;
    bool force_cpu = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config") {
                if (++i < argc) config_file = argv[i];
            } else if (arg == "-f" || arg == "--frames") {
                if (++i < argc) frames = std::stoi(argv[i]);
            } else if (arg == "--high") {
                if (++i < argc) high_threshold = std::stod(argv[i]);
            } else if (arg == "--low") {
                if (++i < argc) low_threshold = std::stod(argv[i]);
            } else if (arg == "-m" || arg == "--memory") {
                if (++i < argc) memory_mb = std::stoul(argv[i]);
            } else if (arg == "--cpu") {
                force_cpu = true;
            } else if (arg == "--job-id") {
                if (++i < argc) job_id = argv[i];
            } else if (arg == "--progress") {
                show_progress = true;
            } else if (arg == "--output") {
                if (++i < argc) output_file = argv[i];
            } else if (arg == "--batch") {
                batch_mode = true;
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                video_paths.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument value (" << e.what() << ")\n";
        return 1;
    }

    if (video_paths.empty()) {
        std::cerr << "Error: No video path provided\n";
        return 1;
    }
    if (video_paths.size() > 1 && !batch_mode) {
        std::cerr << "Error: Several video paths given, use --batch\n";
        return 1;
    }

    try {
        deepscan::DetectionConfig config;
        if (!config_file.empty()) {
            config = deepscan::load_config(config_file);
        }
        if (frames) config.frame_count = *frames;
        if (high_threshold) config.fusion.high_threshold = *high_threshold;
        if (low_threshold) config.fusion.low_threshold = *low_threshold;
        if (memory_mb) config.registry.max_memory_mb = *memory_mb;
        if (force_cpu) config.registry.inference.use_gpu = false;
        config.validate();

        deepscan::ProgressChannel progress;
        if (show_progress) {
            progress.set_listener([](const deepscan::ProgressEvent& event) {
                std::cerr << deepscan::to_json(event).dump() << std::endl;
            });
        }

        deepscan::DetectionService service(config, nullptr, &progress);

        if (info_only) {
            json info_json = json::array();
            for (const auto& path : video_paths) {
                json entry = deepscan::to_json(service.pipeline().probe(path));
                entry["video_path"] = path;
                info_json.push_back(entry);
            }
            std::cout << (info_json.size() == 1 ? info_json[0] : info_json).dump(2) << std::endl;
            return 0;
        }

        auto start_time = std::chrono::high_resolution_clock::now();
        json output_json;
        int exit_code = 0;

        if (batch_mode) {
            auto items = service.run_batch(video_paths);

            for (const auto& item : items) {
                if (item.report) {
                    output_json[item.video_path] = deepscan::to_json(*item.report);
                } else {
                    output_json[item.video_path] = {{"error", item.error.value_or("unknown error")}};
                    exit_code = 2;
                }
            }
        } else {
            auto future = service.submit(video_paths.front(), job_id);
            auto report = future.get();

            output_json = deepscan::to_json(report);
            auto end_time = std::chrono::high_resolution_clock::now();
            output_json["total_time_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                end_time - start_time).count();
        }

        progress.close();

        if (!output_file.empty()) {
            std::ofstream file(output_file);
            if (!file) {
                throw deepscan::DetectionError("Cannot open output file: " + output_file);
            }
            file << output_json.dump(2);
            std::cout << "Results saved to: " << output_file << std::endl;
        } else {
            std::cout << output_json.dump(2) << std::endl;
        }

        return exit_code;

    } catch (const deepscan::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
