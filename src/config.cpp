#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace deepscan {

namespace {

BackboneDescriptor descriptor_from_json(const json& j) {
    BackboneDescriptor d;
    d.name = j.at("name").get<std::string>();
    d.family = parse_backbone_family(j.at("family").get<std::string>());
    d.runtime = parse_backbone_runtime(j.value("runtime", std::string("torchscript")));
    d.weights_path = j.value("weights", std::string());

    if (j.contains("input_size")) {
        const auto& size = j.at("input_size");
        if (!size.is_array() || size.size() != 2) {
            throw ConfigError("input_size of '" + d.name + "' must be [width, height]");
        }
        d.input_size = cv::Size(size[0].get<int>(), size[1].get<int>());
    }

    d.estimated_memory_mb = j.value("memory_mb", static_cast<size_t>(0));
    d.output_dim = j.value("output_dim", static_cast<size_t>(2));
    d.prior = j.value("prior", 1.0);
    return d;
}

json descriptor_to_json(const BackboneDescriptor& d) {
    return json{
        {"name", d.name},
        {"family", to_string(d.family)},
        {"runtime", to_string(d.runtime)},
        {"weights", d.weights_path},
        {"input_size", {d.input_size.width, d.input_size.height}},
        {"memory_mb", d.estimated_memory_mb},
        {"output_dim", d.output_dim},
        {"prior", d.prior}
    };
}

} // namespace

std::map<std::string, double> DetectionConfig::priors() const {
    std::map<std::string, double> result;
    for (const auto& d : backbones) {
        result[d.name] = d.prior;
    }
    for (const auto& [name, prior] : fusion.backbone_priors) {
        result[name] = prior;
    }
    return result;
}

void DetectionConfig::validate() const {
    if (frame_count < 1) {
        throw ConfigError("frame_count must be at least 1, got " + std::to_string(frame_count));
    }
    if (fusion.low_threshold < 0.0 || fusion.high_threshold > 1.0) {
        throw ConfigError("Verdict thresholds must lie in [0, 1]");
    }
    if (fusion.low_threshold >= fusion.high_threshold) {
        throw ConfigError("low_threshold must be below high_threshold");
    }
    for (const auto& [name, prior] : fusion.backbone_priors) {
        if (prior < 0.0) {
            throw ConfigError("Prior for '" + name + "' must be non-negative");
        }
    }
    if (analytics.moving_average_window < 1) {
        throw ConfigError("moving_average_window must be at least 1");
    }
    if (analytics.smoothing_alpha <= 0.0 || analytics.smoothing_alpha > 1.0) {
        throw ConfigError("smoothing_alpha must lie in (0, 1]");
    }
    if (!(analytics.medium_band <= analytics.high_band && analytics.high_band <= analytics.critical_band)) {
        throw ConfigError("Distribution bands must be ascending");
    }
    if (registry.max_load_retries < 0) {
        throw ConfigError("max_load_retries must be non-negative");
    }

    std::set<std::string> names;
    for (const auto& d : backbones) {
        if (d.name.empty()) {
            throw ConfigError("Backbone without a name");
        }
        if (!names.insert(d.name).second) {
            throw ConfigError("Duplicate backbone name: " + d.name);
        }
        if (d.output_dim == 0) {
            throw ConfigError("Backbone '" + d.name + "' declares output_dim 0");
        }
        if (d.prior < 0.0) {
            throw ConfigError("Backbone '" + d.name + "' declares a negative prior");
        }
        if (d.input_size.width <= 0 || d.input_size.height <= 0) {
            throw ConfigError("Backbone '" + d.name + "' declares an empty input size");
        }
    }
}

DetectionConfig config_from_json(const json& j) {
    DetectionConfig config;

    try {
        config.frame_count = j.value("frame_count", config.frame_count);
        config.parallel_inference = j.value("parallel_inference", config.parallel_inference);
        config.unload_after_job = j.value("unload_after_job", config.unload_after_job);

        config.fusion.high_threshold = j.value("high_threshold", config.fusion.high_threshold);
        config.fusion.low_threshold = j.value("low_threshold", config.fusion.low_threshold);
        if (j.contains("backbone_priors")) {
            config.fusion.backbone_priors =
                j.at("backbone_priors").get<std::map<std::string, double>>();
        }

        if (j.contains("analytics")) {
            const auto& a = j.at("analytics");
            auto& cfg = config.analytics;
            cfg.moving_average_window = a.value("moving_average_window", cfg.moving_average_window);
            cfg.peak_threshold = a.value("peak_threshold", cfg.peak_threshold);
            cfg.trend_threshold = a.value("trend_threshold", cfg.trend_threshold);
            cfg.smoothing_alpha = a.value("smoothing_alpha", cfg.smoothing_alpha);
            cfg.medium_band = a.value("medium_band", cfg.medium_band);
            cfg.high_band = a.value("high_band", cfg.high_band);
            cfg.critical_band = a.value("critical_band", cfg.critical_band);
        }

        auto& reg = config.registry;
        reg.max_memory_mb = j.value("memory_limit_mb", reg.max_memory_mb);
        reg.max_load_retries = j.value("max_load_retries", reg.max_load_retries);
        reg.retry_backoff = std::chrono::milliseconds(
            j.value("retry_backoff_ms", static_cast<int64_t>(reg.retry_backoff.count())));
        reg.inference.use_gpu = j.value("use_gpu", reg.inference.use_gpu);
        reg.inference.num_threads = j.value("num_threads", reg.inference.num_threads);

        if (j.contains("backbones")) {
            for (const auto& entry : j.at("backbones")) {
                config.backbones.push_back(descriptor_from_json(entry));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    config.validate();
    return config;
}

json config_to_json(const DetectionConfig& config) {
    json backbones = json::array();
    for (const auto& d : config.backbones) {
        backbones.push_back(descriptor_to_json(d));
    }

    return json{
        {"frame_count", config.frame_count},
        {"parallel_inference", config.parallel_inference},
        {"unload_after_job", config.unload_after_job},
        {"high_threshold", config.fusion.high_threshold},
        {"low_threshold", config.fusion.low_threshold},
        {"backbone_priors", config.fusion.backbone_priors},
        {"analytics", {
            {"moving_average_window", config.analytics.moving_average_window},
            {"peak_threshold", config.analytics.peak_threshold},
            {"trend_threshold", config.analytics.trend_threshold},
            {"smoothing_alpha", config.analytics.smoothing_alpha},
            {"medium_band", config.analytics.medium_band},
            {"high_band", config.analytics.high_band},
            {"critical_band", config.analytics.critical_band}
        }},
        {"memory_limit_mb", config.registry.max_memory_mb},
        {"max_load_retries", config.registry.max_load_retries},
        {"retry_backoff_ms", config.registry.retry_backoff.count()},
        {"use_gpu", config.registry.inference.use_gpu},
        {"num_threads", config.registry.inference.num_threads},
        {"backbones", backbones}
    };
}

DetectionConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }

    auto config = config_from_json(j);
    std::cout << "Loaded configuration from " << path << " ("
              << config.backbones.size() << " backbones)" << std::endl;
    return config;
}

} // namespace deepscan
