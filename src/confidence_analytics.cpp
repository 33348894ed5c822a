#include "confidence_analytics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace deepscan {

ConfidenceAnalytics::ConfidenceAnalytics(AnalyticsConfig config) : config_(config) {
    if (config_.moving_average_window < 1) {
        throw ConfigError("moving_average_window must be at least 1");
    }
}

ConfidenceStatistics ConfidenceAnalytics::analyze(const std::vector<double>& values,
                                                  const std::vector<size_t>& frame_indices) const {
    ConfidenceStatistics stats;
    if (values.empty()) {
        return stats;
    }
    if (!frame_indices.empty() && frame_indices.size() != values.size()) {
        throw DetectionError("frame_indices must be parallel to the analyzed values");
    }

    const auto n = static_cast<double>(values.size());
    stats.count = values.size();
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    stats.median = sorted.size() % 2 == 1 ? sorted[mid] : (sorted[mid - 1] + sorted[mid]) / 2.0;

    double variance = 0.0;
    for (double v : values) {
        variance += (v - stats.mean) * (v - stats.mean);
    }
    stats.stddev = std::sqrt(variance / n);

    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.range = stats.max - stats.min;

    stats.distribution = distribution(values);
    stats.trends = trend_ratios(values);
    stats.linear_trend = linear_trend(values);
    stats.moving_average = moving_average(values);
    stats.smoothed = exponential_smoothing(values);
    detect_extrema(values, frame_indices, stats.peaks, stats.valleys);

    return stats;
}

std::vector<double> ConfidenceAnalytics::moving_average(const std::vector<double>& values) const {
    const auto window = static_cast<size_t>(config_.moving_average_window);
    if (values.size() < window) {
        return values;
    }

    std::vector<double> result;
    result.reserve(values.size());

    double running = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        running += values[i];
        if (i >= window) {
            running -= values[i - window];
        }
        const size_t span = std::min(i + 1, window);
        result.push_back(running / static_cast<double>(span));
    }
    return result;
}

std::vector<double> ConfidenceAnalytics::exponential_smoothing(const std::vector<double>& values) const {
    std::vector<double> result;
    if (values.empty()) {
        return result;
    }

    const double alpha = config_.smoothing_alpha;
    result.reserve(values.size());
    result.push_back(values.front());
    for (size_t i = 1; i < values.size(); ++i) {
        result.push_back(alpha * values[i] + (1.0 - alpha) * result.back());
    }
    return result;
}

LinearTrend ConfidenceAnalytics::linear_trend(const std::vector<double>& values) const {
    LinearTrend trend;
    if (values.empty()) {
        return trend;
    }
    if (values.size() < 2) {
        trend.intercept = values.front();
        return trend;
    }

    const auto n = static_cast<double>(values.size());
    const double x_mean = (n - 1.0) / 2.0;
    const double y_mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    double numerator = 0.0;
    double denominator = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        numerator += dx * (values[i] - y_mean);
        denominator += dx * dx;
    }

    trend.slope = denominator == 0.0 ? 0.0 : numerator / denominator;
    trend.intercept = y_mean - trend.slope * x_mean;
    return trend;
}

TrendRatios ConfidenceAnalytics::trend_ratios(const std::vector<double>& values) const {
    TrendRatios ratios;
    if (values.size() < 2) {
        return ratios;
    }

    size_t increasing = 0;
    size_t decreasing = 0;
    size_t stable = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        const double diff = values[i] - values[i - 1];
        if (diff > config_.trend_threshold) {
            ++increasing;
        } else if (diff < -config_.trend_threshold) {
            ++decreasing;
        } else {
            ++stable;
        }
    }

    const auto steps = static_cast<double>(values.size() - 1);
    ratios.increasing = increasing / steps;
    ratios.decreasing = decreasing / steps;
    ratios.stable = stable / steps;
    return ratios;
}

BandDistribution ConfidenceAnalytics::distribution(const std::vector<double>& values) const {
    BandDistribution bands;
    for (double v : values) {
        if (v >= config_.critical_band) {
            ++bands.critical;
        } else if (v >= config_.high_band) {
            ++bands.high;
        } else if (v >= config_.medium_band) {
            ++bands.medium;
        } else {
            ++bands.low;
        }
    }
    return bands;
}

void ConfidenceAnalytics::detect_extrema(const std::vector<double>& values,
                                         const std::vector<size_t>& frame_indices,
                                         std::vector<Extremum>& peaks,
                                         std::vector<Extremum>& valleys) const {
    peaks.clear();
    valleys.clear();
    if (values.size() < 3) {
        return;
    }

    const double threshold = config_.peak_threshold;
    auto frame_of = [&frame_indices](size_t i) {
        return frame_indices.empty() ? i : frame_indices[i];
    };

    for (size_t i = 1; i + 1 < values.size(); ++i) {
        const double prev = values[i - 1];
        const double curr = values[i];
        const double next = values[i + 1];

        if (curr > prev && curr > next) {
            const double prominence = curr - std::max(prev, next);
            if (prominence > threshold) {
                peaks.push_back({i, frame_of(i), curr, prominence});
            }
        }

        if (curr < prev && curr < next) {
            const double prominence = std::min(prev, next) - curr;
            if (prominence > threshold) {
                valleys.push_back({i, frame_of(i), curr, prominence});
            }
        }
    }
}

} // namespace deepscan
