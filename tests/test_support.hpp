#pragma once

#include "backbone.hpp"
#include "errors.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace deepscan {
namespace test {

// Scripted behaviour of one fake backbone, shared with the test so it can
// inspect what the registry and pipeline did with it
struct FakeBehavior {
    double probability = 0.5;
    std::function<double(const Frame&)> score;

    int transient_failures = 0;
    bool permanent_failure = false;
    std::set<size_t> failing_frames;
    bool shape_mismatch = false;
    std::chrono::milliseconds infer_delay{0};

    std::atomic<int> load_attempts{0};
    std::atomic<int> releases{0};
    std::atomic<int> inferences{0};
};

class FakeBackbone : public Backbone {
public:
    FakeBackbone(BackboneDescriptor descriptor, std::shared_ptr<FakeBehavior> behavior)
        : Backbone(std::move(descriptor)), behavior_(std::move(behavior)) {}

    void load() override {
        const int attempt = ++behavior_->load_attempts;
        if (behavior_->permanent_failure) {
            throw BackboneLoadError(name(), "weights not found", false);
        }
        if (attempt <= behavior_->transient_failures) {
            throw BackboneLoadError(name(), "truncated archive", true);
        }
        loaded_ = true;
    }

    void release() override {
        if (loaded_) {
            ++behavior_->releases;
        }
        loaded_ = false;
    }

    bool is_loaded() const override { return loaded_; }

    double infer(const Frame& frame) const override {
        ++behavior_->inferences;
        if (!loaded_) {
            throw FrameInferenceError(name(), frame.index, "not loaded");
        }
        if (behavior_->infer_delay.count() > 0) {
            std::this_thread::sleep_for(behavior_->infer_delay);
        }
        if (behavior_->failing_frames.count(frame.index) > 0) {
            throw FrameInferenceError(name(), frame.index, "corrupt frame");
        }
        if (behavior_->shape_mismatch) {
            throw ShapeMismatchError(name(), descriptor_.output_dim, 1000);
        }
        return behavior_->score ? behavior_->score(frame) : behavior_->probability;
    }

private:
    std::shared_ptr<FakeBehavior> behavior_;
    bool loaded_ = false;
};

// Hands out FakeBackbones by name
class FakeBackboneFactory {
public:
    std::shared_ptr<FakeBehavior> add(const std::string& name, double probability = 0.5) {
        auto behavior = std::make_shared<FakeBehavior>();
        behavior->probability = probability;
        behaviors_[name] = behavior;
        return behavior;
    }

    std::shared_ptr<FakeBehavior> behavior(const std::string& name) const {
        return behaviors_.at(name);
    }

    BackboneFactory factory() const {
        auto behaviors = behaviors_;
        return [behaviors](const BackboneDescriptor& descriptor) -> std::unique_ptr<Backbone> {
            auto it = behaviors.find(descriptor.name);
            if (it == behaviors.end()) {
                throw std::runtime_error("no fake registered for " + descriptor.name);
            }
            return std::make_unique<FakeBackbone>(descriptor, it->second);
        };
    }

private:
    std::map<std::string, std::shared_ptr<FakeBehavior>> behaviors_;
};

inline BackboneDescriptor make_descriptor(const std::string& name, size_t memory_mb = 100,
                                          double prior = 1.0) {
    BackboneDescriptor descriptor;
    descriptor.name = name;
    descriptor.family = BackboneFamily::ResNet50;
    descriptor.runtime = BackboneRuntime::TorchScript;
    descriptor.weights_path = name + ".pt";
    descriptor.estimated_memory_mb = memory_mb;
    descriptor.prior = prior;
    return descriptor;
}

inline RegistryConfig fast_registry_config(size_t memory_mb = 8192) {
    RegistryConfig config;
    config.max_memory_mb = memory_mb;
    config.retry_backoff = std::chrono::milliseconds(0);
    config.inference.use_gpu = false;
    return config;
}

// MJPG in AVI; the gray level rises with the frame number so fakes can tell
// frames apart without relying on the sample index
inline bool write_test_video(const std::string& path, int frames, double fps = 10.0,
                             cv::Size size = cv::Size(160, 120)) {
    cv::VideoWriter writer;
    int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
    if (!writer.open(path, fourcc, fps, size)) {
        return false;
    }

    for (int i = 0; i < frames; ++i) {
        const int level = (i * 255) / std::max(1, frames - 1);
        cv::Mat frame(size, CV_8UC3, cv::Scalar(level, level, level));
        cv::circle(frame, cv::Point((i * 7) % size.width, size.height / 2), 10,
                   cv::Scalar(255, 255, 255), -1);
        writer << frame;
    }
    writer.release();
    return true;
}

} // namespace test
} // namespace deepscan
