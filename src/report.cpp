#include "report.hpp"
#include "errors.hpp"
#include <fstream>

namespace deepscan {

using json = nlohmann::json;

namespace {

json extrema_to_json(const std::vector<Extremum>& extrema) {
    json list = json::array();
    for (const auto& e : extrema) {
        list.push_back({
            {"position", e.position},
            {"frame_index", e.frame_index},
            {"value", e.value},
            {"prominence", e.prominence}
        });
    }
    return list;
}

} // namespace

json to_json(const VideoInfo& info) {
    return json{
        {"total_frames", info.total_frames},
        {"fps", info.fps},
        {"duration", info.duration},
        {"width", info.frame_size.width},
        {"height", info.frame_size.height},
        {"codec", info.codec}
    };
}

json to_json(const BackboneResult& result) {
    json j = {
        {"name", result.name},
        {"ready", result.ready},
        {"duration_ms", result.duration().count()},
        {"load_ms", result.load_duration.count()},
        {"inference_ms", result.inference_duration.count()},
        {"frames_scored", result.probabilities.size()},
        {"dropped_frames", result.dropped_frames}
    };
    if (result.error) {
        j["error"] = *result.error;
    }
    return j;
}

json to_json(const ConfidenceStatistics& stats) {
    return json{
        {"count", stats.count},
        {"mean", stats.mean},
        {"median", stats.median},
        {"stddev", stats.stddev},
        {"min", stats.min},
        {"max", stats.max},
        {"range", stats.range},
        {"distribution", {
            {"low", stats.distribution.low},
            {"medium", stats.distribution.medium},
            {"high", stats.distribution.high},
            {"critical", stats.distribution.critical}
        }},
        {"trends", {
            {"increasing", stats.trends.increasing},
            {"decreasing", stats.trends.decreasing},
            {"stable", stats.trends.stable}
        }},
        {"moving_average", stats.moving_average},
        {"exponential_smoothing", stats.smoothed},
        {"linear_trend", {
            {"slope", stats.linear_trend.slope},
            {"intercept", stats.linear_trend.intercept}
        }},
        {"peaks", extrema_to_json(stats.peaks)},
        {"valleys", extrema_to_json(stats.valleys)}
    };
}

json to_json(const DetectionReport& report) {
    json per_backbone = json::array();
    for (const auto& result : report.per_backbone) {
        json entry = to_json(result);
        auto it = report.weights.find(result.name);
        entry["weight"] = it == report.weights.end() ? 0.0 : it->second;
        per_backbone.push_back(entry);
    }

    json frames = json::array();
    for (const auto& frame : report.frames) {
        frames.push_back({
            {"index", frame.index},
            {"timestamp", frame.timestamp},
            {"probability", frame.probability},
            {"contributors", frame.contributors}
        });
    }

    return json{
        {"job_id", report.job_id},
        {"video_path", report.video_path},
        {"video", to_json(report.video)},
        {"video_probability", report.video_probability},
        {"verdict", to_string(report.verdict)},
        {"overall_confidence", report.overall_confidence},
        {"weights", report.weights},
        {"per_backbone", per_backbone},
        {"per_frame_confidence", report.per_frame_confidence},
        {"frames", frames},
        {"frames_sampled", report.frames_sampled},
        {"uncovered_frames", report.uncovered_frames},
        {"statistics", to_json(report.statistics)},
        {"processing_time_ms", report.processing_time.count()},
        {"peak_model_memory_mb", report.peak_model_memory_mb}
    };
}

void write_report(const DetectionReport& report, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw DetectionError("Cannot open report file for writing: " + path);
    }
    out << to_json(report).dump(2) << std::endl;
    if (!out) {
        throw DetectionError("Failed to write report file: " + path);
    }
}

} // namespace deepscan
