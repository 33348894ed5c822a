#pragma once

#include "confidence_analytics.hpp"
#include "detection_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace deepscan {

nlohmann::json to_json(const VideoInfo& info);
nlohmann::json to_json(const BackboneResult& result);
nlohmann::json to_json(const ConfidenceStatistics& stats);
nlohmann::json to_json(const DetectionReport& report);

// Pretty-printed; throws DetectionError when the file cannot be written
void write_report(const DetectionReport& report, const std::string& path);

} // namespace deepscan
