#include "fusion_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace deepscan {

namespace {

// Absorbs rounding from the weighted mean so a score sitting on a threshold
// lands on the inclusive side
constexpr double kBoundaryEpsilon = 1e-9;

} // namespace

FusionEngine::FusionEngine(FusionConfig config) : config_(std::move(config)) {
    if (config_.low_threshold >= config_.high_threshold) {
        throw ConfigError("low_threshold must be below high_threshold");
    }
}

std::map<std::string, double> FusionEngine::compute_weights(const std::vector<std::string>& ready) const {
    if (ready.empty()) {
        throw NoModelsAvailableError("No backbone is ready, cannot compute ensemble weights");
    }

    std::map<std::string, double> weights;
    double total = 0.0;
    for (const auto& name : ready) {
        auto it = config_.backbone_priors.find(name);
        double prior = it == config_.backbone_priors.end() ? 1.0 : std::max(0.0, it->second);
        weights[name] = prior;
        total += prior;
    }

    if (total <= 0.0) {
        for (auto& [name, weight] : weights) {
            weight = 1.0 / static_cast<double>(weights.size());
        }
        return weights;
    }

    for (auto& [name, weight] : weights) {
        weight /= total;
    }
    return weights;
}

FusionOutcome FusionEngine::fuse(size_t frame_count, const std::vector<BackboneResult>& results) const {
    std::vector<std::string> ready;
    for (const auto& result : results) {
        if (result.ready) {
            ready.push_back(result.name);
        }
    }

    FusionOutcome outcome;
    outcome.weights = compute_weights(ready);

    std::vector<double> weighted_sum(frame_count, 0.0);
    std::vector<double> weight_total(frame_count, 0.0);
    std::vector<double> plain_sum(frame_count, 0.0);
    std::vector<size_t> contributors(frame_count, 0);

    for (const auto& result : results) {
        if (!result.ready) {
            continue;
        }
        const double weight = outcome.weights.at(result.name);
        for (const auto& point : result.probabilities) {
            if (point.frame_index >= frame_count) {
                std::cout << "Ignoring probability for frame " << point.frame_index
                          << " from " << result.name << " (only " << frame_count
                          << " frames sampled)" << std::endl;
                continue;
            }
            weighted_sum[point.frame_index] += weight * point.probability;
            weight_total[point.frame_index] += weight;
            plain_sum[point.frame_index] += point.probability;
            ++contributors[point.frame_index];
        }
    }

    double video_sum = 0.0;
    for (size_t i = 0; i < frame_count; ++i) {
        if (contributors[i] == 0) {
            outcome.uncovered_frames.push_back(i);
            continue;
        }

        FusedFrame frame;
        frame.frame_index = i;
        frame.contributors = contributors[i];
        // Only zero-prior backbones scored this frame
        frame.probability = weight_total[i] > 0.0
            ? weighted_sum[i] / weight_total[i]
            : plain_sum[i] / static_cast<double>(contributors[i]);
        frame.probability = std::clamp(frame.probability, 0.0, 1.0);

        video_sum += frame.probability;
        outcome.frames.push_back(frame);
    }

    if (outcome.frames.empty()) {
        throw NoModelsAvailableError("No ready backbone produced a probability for any frame");
    }

    outcome.video_probability = video_sum / static_cast<double>(outcome.frames.size());
    outcome.verdict = classify(outcome.video_probability);
    outcome.overall_confidence = std::abs(outcome.video_probability - 0.5) * 2.0;
    return outcome;
}

Verdict FusionEngine::classify(double probability) const {
    if (probability >= config_.high_threshold - kBoundaryEpsilon) {
        return Verdict::Fake;
    }
    if (probability <= config_.low_threshold + kBoundaryEpsilon) {
        return Verdict::Real;
    }
    return Verdict::Suspicious;
}

} // namespace deepscan
