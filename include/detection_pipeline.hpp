#pragma once

#include "confidence_analytics.hpp"
#include "config.hpp"
#include "detection_types.hpp"
#include "model_registry.hpp"
#include "progress_channel.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace deepscan {

struct FrameVerdict {
    size_t index = 0;
    double timestamp = 0.0;
    double probability = 0.0;
    size_t contributors = 0;
};

struct DetectionReport {
    std::string job_id;
    std::string video_path;
    VideoInfo video;

    double video_probability = 0.0;
    Verdict verdict = Verdict::Suspicious;
    double overall_confidence = 0.0;
    std::map<std::string, double> weights;

    std::vector<BackboneResult> per_backbone;
    std::vector<double> per_frame_confidence;
    std::vector<FrameVerdict> frames;
    std::vector<size_t> uncovered_frames;
    ConfidenceStatistics statistics;

    size_t frames_sampled = 0;
    std::chrono::milliseconds processing_time{0};
    // High-water mark of backbone memory in the shared registry so far
    size_t peak_model_memory_mb = 0;
};

// Runs one job end to end on the calling thread: sample, load, infer,
// fuse, analyze. Safe to share between threads; every run keeps its own
// frames and results and only the registry is common.
class DetectionPipeline {
public:
    DetectionPipeline(DetectionConfig config,
                      std::shared_ptr<ModelRegistry> registry,
                      ProgressChannel* progress = nullptr);
    ~DetectionPipeline();

    DetectionPipeline(const DetectionPipeline&) = delete;
    DetectionPipeline& operator=(const DetectionPipeline&) = delete;

    // Throws on fatal errors (decode, empty video, no backbone available)
    // after setting the job to failed; JobCancelledError after setting it
    // to cancelled. Nothing partial is returned in either case.
    DetectionReport run(VideoJob& job, const CancellationToken& cancel);
    DetectionReport run(VideoJob& job);

    VideoInfo probe(const std::string& video_path) const;

    // Backbones a job will try, in load order
    std::vector<std::string> ensemble() const;

    const DetectionConfig& config() const;
    ModelRegistry& registry();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace deepscan
