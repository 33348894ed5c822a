#pragma once

#include "config.hpp"
#include "detection_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace deepscan {

struct FusedFrame {
    size_t frame_index = 0;
    double probability = 0.0;
    size_t contributors = 0;
};

struct FusionOutcome {
    double video_probability = 0.0;
    Verdict verdict = Verdict::Suspicious;
    // Distance from the undecided midpoint, 0 (coin flip) .. 1 (certain)
    double overall_confidence = 0.0;
    std::map<std::string, double> weights;
    std::vector<FusedFrame> frames;
    std::vector<size_t> uncovered_frames;
};

class FusionEngine {
public:
    explicit FusionEngine(FusionConfig config = {});

    // Prior-proportional weights renormalized over `ready`. Missing priors
    // count as 1.0; all-zero priors fall back to uniform weights.
    std::map<std::string, double> compute_weights(const std::vector<std::string>& ready) const;

    // Weighted per-frame mean over the backbones that scored each frame,
    // then a plain mean over frames. Throws NoModelsAvailableError when no
    // ready backbone contributed anything.
    FusionOutcome fuse(size_t frame_count, const std::vector<BackboneResult>& results) const;

    // Inclusive on both thresholds
    Verdict classify(double probability) const;

    const FusionConfig& config() const { return config_; }

private:
    FusionConfig config_;
};

} // namespace deepscan
