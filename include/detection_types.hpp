#pragma once

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deepscan {

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

// A sampled frame. `index` is the position in the sample, `source_index`
// the position in the decoded stream.
struct Frame {
    size_t index = 0;
    int64_t source_index = 0;
    double timestamp = 0.0;
    cv::Mat pixels; // BGR, as decoded
};

enum class BackboneFamily {
    ResNet50,
    EfficientNetB0,
    ConvNeXtLarge,
    ViTLarge,
    SwinLarge,
    ClipViTB32,
    LaaNet
};

enum class BackboneRuntime {
    TorchScript,
    Onnx
};

enum class LoadState {
    Unloaded,
    Loading,
    Ready,
    Failed
};

struct BackboneDescriptor {
    std::string name;
    BackboneFamily family = BackboneFamily::ResNet50;
    BackboneRuntime runtime = BackboneRuntime::TorchScript;
    std::string weights_path;
    cv::Size input_size{224, 224};
    size_t estimated_memory_mb = 0;
    // Declared output width. Never discovered by a trial forward pass.
    size_t output_dim = 2;
    double prior = 1.0;
};

struct FrameProbability {
    size_t frame_index = 0;
    double probability = 0.0;
};

struct BackboneResult {
    std::string name;
    bool ready = false;
    std::vector<FrameProbability> probabilities; // ordered by frame_index
    std::vector<size_t> dropped_frames;
    std::chrono::milliseconds load_duration{0};
    std::chrono::milliseconds inference_duration{0};
    std::optional<std::string> error;

    std::chrono::milliseconds duration() const { return load_duration + inference_duration; }
};

enum class Verdict {
    Fake,
    Real,
    Suspicious
};

enum class JobStatus {
    Pending,
    Sampling,
    Loading,
    Inferring,
    Fusing,
    Completed,
    Failed,
    Cancelled
};

class VideoJob {
public:
    VideoJob(std::string id, std::string video_path, int frame_count = 16)
        : id_(std::move(id)), video_path_(std::move(video_path)), frame_count_(frame_count) {}

    VideoJob(const VideoJob&) = delete;
    VideoJob& operator=(const VideoJob&) = delete;

    const std::string& id() const { return id_; }
    const std::string& video_path() const { return video_path_; }
    int frame_count() const { return frame_count_; }

    JobStatus status() const { return status_.load(); }
    void set_status(JobStatus status) { status_.store(status); }

    bool is_terminal() const;

private:
    std::string id_;
    std::string video_path_;
    int frame_count_;
    std::atomic<JobStatus> status_{JobStatus::Pending};
};

// Cooperative cancellation flag shared between a job and whoever may cancel it
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

std::string to_string(BackboneFamily family);
std::string to_string(BackboneRuntime runtime);
std::string to_string(LoadState state);
std::string to_string(Verdict verdict);
std::string to_string(JobStatus status);

BackboneFamily parse_backbone_family(const std::string& value);
BackboneRuntime parse_backbone_runtime(const std::string& value);

} // namespace deepscan
