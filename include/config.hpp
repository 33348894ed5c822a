#pragma once

#include "detection_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace deepscan {

struct FusionConfig {
    double high_threshold = 0.65;
    double low_threshold = 0.35;
    // Overrides the prior declared by a backbone descriptor
    std::map<std::string, double> backbone_priors;
};

struct AnalyticsConfig {
    int moving_average_window = 10;
    double peak_threshold = 0.05;
    double trend_threshold = 0.01;
    double smoothing_alpha = 0.3;

    // Distribution band lower bounds; anything below medium is "low"
    double medium_band = 0.4;
    double high_band = 0.7;
    double critical_band = 0.9;
};

struct InferenceOptions {
    bool use_gpu = true;
    int num_threads = static_cast<int>(std::thread::hardware_concurrency());
};

struct RegistryConfig {
    size_t max_memory_mb = 8192;
    int max_load_retries = 3;
    std::chrono::milliseconds retry_backoff{500};
    InferenceOptions inference;
};

struct DetectionConfig {
    int frame_count = 16;
    bool parallel_inference = true;
    bool unload_after_job = false;

    FusionConfig fusion;
    AnalyticsConfig analytics;
    RegistryConfig registry;
    std::vector<BackboneDescriptor> backbones;

    // Effective prior per backbone: descriptor prior unless overridden
    std::map<std::string, double> priors() const;

    void validate() const;
};

DetectionConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const DetectionConfig& config);

DetectionConfig load_config(const std::string& path);

} // namespace deepscan
