#include "confidence_analytics.hpp"
#include "frame_sampler.hpp"
#include "fusion_engine.hpp"
#include "memory_manager.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>
#include <opencv2/opencv.hpp>
#include <iostream>
#include <thread>

namespace deepscan {

class SamplingFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        create_synthetic_video();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::remove("benchmark_video.avi");
    }

protected:
    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        writer.open("benchmark_video.avi", fourcc, 30.0, cv::Size(1280, 720));

        if (!writer.isOpened()) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);

        // 300 frames, 10 seconds at 30fps
        for (int i = 0; i < 300; ++i) {
            cv::Mat frame = cv::Mat::zeros(720, 1280, CV_8UC3);

            for (int y = 0; y < frame.rows; y += 40) {
                for (int x = 0; x < frame.cols; x += 40) {
                    cv::Scalar color(dis(gen), dis(gen), dis(gen));
                    cv::rectangle(frame, cv::Point(x, y), cv::Point(x + 38, y + 38), color, -1);
                }
            }

            int circle_x = (i * 5) % frame.cols;
            int circle_y = 300 + static_cast<int>(100 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 50, cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();
    }

    FrameSampler sampler_;
};

// Decode cost of sampling N frames out of 300
BENCHMARK_DEFINE_F(SamplingFixture, FrameSampling)(benchmark::State& state) {
    const int frame_count = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto frames = sampler_.sample("benchmark_video.avi", frame_count);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(frames.size());
        state.counters["frames_per_second"] = static_cast<double>(frames.size()) / elapsed_seconds.count();
    }
}

static std::vector<BackboneResult> synthetic_results(size_t backbones, size_t frames) {
    std::mt19937 gen(7);
    std::uniform_real_distribution<> dis(0.0, 1.0);

    std::vector<BackboneResult> results;
    for (size_t b = 0; b < backbones; ++b) {
        BackboneResult result;
        result.name = "backbone_" + std::to_string(b);
        result.ready = true;
        for (size_t f = 0; f < frames; ++f) {
            // Leave a few holes so the renormalization path is exercised
            if ((f + b) % 11 == 0) {
                result.dropped_frames.push_back(f);
                continue;
            }
            result.probabilities.push_back({f, dis(gen)});
        }
        results.push_back(std::move(result));
    }
    return results;
}

static void BM_Fusion(benchmark::State& state) {
    const auto frames = static_cast<size_t>(state.range(0));
    const auto results = synthetic_results(5, frames);

    FusionConfig config;
    config.backbone_priors = {{"backbone_0", 0.4}, {"backbone_1", 0.5}, {"backbone_2", 0.1}};
    FusionEngine engine(config);

    for (auto _ : state) {
        auto outcome = engine.fuse(frames, results);
        benchmark::DoNotOptimize(outcome.video_probability);
    }
    state.counters["frames"] = static_cast<double>(frames);
}

static void BM_ConfidenceAnalytics(benchmark::State& state) {
    std::mt19937 gen(11);
    std::uniform_real_distribution<> dis(0.0, 1.0);

    std::vector<double> series(static_cast<size_t>(state.range(0)));
    for (auto& value : series) {
        value = dis(gen);
    }

    ConfidenceAnalytics analytics;
    for (auto _ : state) {
        auto stats = analytics.analyze(series);
        benchmark::DoNotOptimize(stats.mean);
    }
    state.counters["points"] = static_cast<double>(series.size());
}

static void BM_MemoryAccounting(benchmark::State& state) {
    MemoryManager memory_manager(megabytes(8192));

    for (auto _ : state) {
        memory_manager.track_allocation("benchmark", megabytes(100));
        benchmark::DoNotOptimize(memory_manager.is_memory_available(megabytes(2048)));
        memory_manager.release_tag("benchmark");
    }
    state.counters["peak_usage"] = static_cast<double>(memory_manager.get_peak_usage());
}

BENCHMARK_REGISTER_F(SamplingFixture, FrameSampling)->Range(4, 64)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Fusion)->Range(16, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_ConfidenceAnalytics)->Range(16, 4096)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_MemoryAccounting)->Unit(benchmark::kNanosecond);

} // namespace deepscan

int main(int argc, char** argv) {
    std::cout << "deepscan Ensemble Detection - Performance Benchmarks" << std::endl;
    std::cout << "====================================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
