#pragma once

#include "config.hpp"
#include <cstddef>
#include <vector>

namespace deepscan {

struct Extremum {
    size_t position = 0;    // index within the analyzed series
    size_t frame_index = 0; // sampled frame it belongs to
    double value = 0.0;
    double prominence = 0.0;
};

struct BandDistribution {
    size_t low = 0;
    size_t medium = 0;
    size_t high = 0;
    size_t critical = 0;
};

// Fractions of consecutive steps that rise, fall or stay within the threshold
struct TrendRatios {
    double increasing = 0.0;
    double decreasing = 0.0;
    double stable = 0.0;
};

struct LinearTrend {
    double slope = 0.0;
    double intercept = 0.0;
};

struct ConfidenceStatistics {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;

    BandDistribution distribution;
    TrendRatios trends;
    LinearTrend linear_trend;
    std::vector<double> moving_average;
    std::vector<double> smoothed;
    std::vector<Extremum> peaks;
    std::vector<Extremum> valleys;
};

// Descriptive statistics over the fused per-frame series. Nothing computed
// here influences the verdict.
class ConfidenceAnalytics {
public:
    explicit ConfidenceAnalytics(AnalyticsConfig config = {});

    // `frame_indices`, when given, must be parallel to `values`
    ConfidenceStatistics analyze(const std::vector<double>& values,
                                 const std::vector<size_t>& frame_indices = {}) const;

    // Trailing window; series shorter than the window come back unchanged
    std::vector<double> moving_average(const std::vector<double>& values) const;
    std::vector<double> exponential_smoothing(const std::vector<double>& values) const;
    LinearTrend linear_trend(const std::vector<double>& values) const;
    TrendRatios trend_ratios(const std::vector<double>& values) const;
    BandDistribution distribution(const std::vector<double>& values) const;

    void detect_extrema(const std::vector<double>& values,
                        const std::vector<size_t>& frame_indices,
                        std::vector<Extremum>& peaks,
                        std::vector<Extremum>& valleys) const;

    const AnalyticsConfig& config() const { return config_; }

private:
    AnalyticsConfig config_;
};

} // namespace deepscan
