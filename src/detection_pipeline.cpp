#include "detection_pipeline.hpp"
#include "errors.hpp"
#include "frame_sampler.hpp"
#include "fusion_engine.hpp"
#include <exception>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace deepscan {

namespace {

struct InferenceRun {
    std::vector<FrameProbability> probabilities;
    std::vector<size_t> dropped_frames;
    std::chrono::milliseconds duration{0};
    // Set when the backbone had to be taken out of service mid-run
    std::optional<std::string> failure;
};

std::string format_probability(double p) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << p;
    return out.str();
}

} // namespace

class DetectionPipeline::Impl {
public:
    Impl(DetectionConfig config, std::shared_ptr<ModelRegistry> registry, ProgressChannel* progress)
        : config_(std::move(config))
        , registry_(std::move(registry))
        , progress_(progress)
        , analytics_(config_.analytics) {

        config_.validate();
        if (!registry_) {
            throw ConfigError("DetectionPipeline requires a model registry");
        }

        for (const auto& descriptor : config_.backbones) {
            if (!registry_->has_backbone(descriptor.name)) {
                registry_->register_backbone(descriptor);
            }
        }

        std::cout << "DetectionPipeline initialized with:" << std::endl;
        std::cout << "  Frames per job: " << config_.frame_count << std::endl;
        std::cout << "  Backbones: " << ensemble().size() << std::endl;
        std::cout << "  Thresholds: " << config_.fusion.low_threshold << " / "
                  << config_.fusion.high_threshold << std::endl;
        std::cout << "  Parallel inference: " << (config_.parallel_inference ? "yes" : "no") << std::endl;
    }

    std::vector<std::string> ensemble() const {
        std::vector<std::string> names;
        if (!config_.backbones.empty()) {
            for (const auto& descriptor : config_.backbones) {
                names.push_back(descriptor.name);
            }
            return names;
        }
        for (const auto& descriptor : registry_->descriptors()) {
            names.push_back(descriptor.name);
        }
        return names;
    }

    // Declared priors of the backbones the registry holds, then the manifest's,
    // then explicit overrides
    std::map<std::string, double> ensemble_priors() const {
        std::map<std::string, double> priors;
        for (const auto& descriptor : registry_->descriptors()) {
            priors[descriptor.name] = descriptor.prior;
        }
        for (const auto& [name, prior] : config_.priors()) {
            priors[name] = prior;
        }
        return priors;
    }

    DetectionReport run(VideoJob& job, const CancellationToken& cancel) {
        if (job.status() != JobStatus::Pending) {
            throw DetectionError("Job '" + job.id() + "' already ran (" + to_string(job.status()) + ")");
        }

        ProgressEmitter emitter(progress_, job.id());
        std::vector<std::string> loaded;

        try {
            auto report = execute(job, cancel, emitter, loaded);
            finish_job(loaded);
            job.set_status(JobStatus::Completed);
            emitter.completed("Verdict " + to_string(report.verdict) + " (p=" +
                              format_probability(report.video_probability) + ")");
            return report;
        } catch (const JobCancelledError& e) {
            finish_job(loaded);
            job.set_status(JobStatus::Cancelled);
            emitter.failed(e.what());
            std::cout << "Job " << job.id() << " cancelled" << std::endl;
            throw;
        } catch (const std::exception& e) {
            finish_job(loaded);
            job.set_status(JobStatus::Failed);
            emitter.failed(e.what());
            std::cerr << "❌ Job " << job.id() << " failed: " << e.what() << std::endl;
            throw;
        }
    }

    VideoInfo probe(const std::string& video_path) const {
        return sampler_.probe(video_path);
    }

    const DetectionConfig& config() const { return config_; }
    ModelRegistry& registry() { return *registry_; }

private:
    DetectionReport execute(VideoJob& job, const CancellationToken& cancel,
                            ProgressEmitter& emitter, std::vector<std::string>& loaded) {
        auto start_time = std::chrono::steady_clock::now();
        auto check_cancel = [&]() {
            if (cancel.is_cancelled()) {
                throw JobCancelledError(job.id());
            }
        };

        DetectionReport report;
        report.job_id = job.id();
        report.video_path = job.video_path();

        // Sampling
        check_cancel();
        job.set_status(JobStatus::Sampling);
        report.video = sampler_.probe(job.video_path());
        std::vector<Frame> frames = sampler_.sample(job.video_path(), job.frame_count());
        report.frames_sampled = frames.size();
        emitter.sampling("Sampled " + std::to_string(frames.size()) + " frames");

        std::vector<double> timestamps;
        timestamps.reserve(frames.size());
        for (const auto& frame : frames) {
            timestamps.push_back(frame.timestamp);
        }

        // Loading, one backbone at a time
        job.set_status(JobStatus::Loading);
        const auto names = ensemble();
        std::vector<BackboneResult> results(names.size());
        std::vector<BackboneLease> leases(names.size());

        for (size_t i = 0; i < names.size(); ++i) {
            check_cancel();

            BackboneResult& result = results[i];
            result.name = names[i];

            LoadOutcome outcome = registry_->load(names[i]);
            result.load_duration = outcome.duration;

            if (outcome.ready()) {
                try {
                    leases[i] = registry_->acquire(names[i]);
                    result.ready = true;
                    loaded.push_back(names[i]);
                } catch (const DetectionError& e) {
                    // Evicted by another job between load and acquire
                    result.error = e.what();
                }
            } else {
                result.error = outcome.error.value_or("load failed");
            }

            emitter.model_loaded(names[i], i + 1, names.size(),
                                 result.ready ? names[i] + " ready"
                                              : names[i] + " unavailable: " + *result.error);
        }

        if (loaded.empty()) {
            throw NoModelsAvailableError("No backbone could be loaded for job " + job.id());
        }

        // Inference
        check_cancel();
        job.set_status(JobStatus::Inferring);
        run_inference(job, cancel, frames, results, leases, emitter);

        for (auto& lease : leases) {
            lease.reset();
        }
        frames.clear();
        frames.shrink_to_fit();

        // Fusion
        check_cancel();
        job.set_status(JobStatus::Fusing);
        emitter.fusing("Fusing " + std::to_string(loaded.size()) + " backbone(s)");

        FusionConfig fusion_config = config_.fusion;
        fusion_config.backbone_priors = ensemble_priors();
        FusionOutcome fused = FusionEngine(fusion_config).fuse(report.frames_sampled, results);

        report.video_probability = fused.video_probability;
        report.verdict = fused.verdict;
        report.overall_confidence = fused.overall_confidence;
        report.weights = fused.weights;
        report.uncovered_frames = fused.uncovered_frames;

        std::vector<size_t> frame_indices;
        for (const auto& frame : fused.frames) {
            report.per_frame_confidence.push_back(frame.probability);
            frame_indices.push_back(frame.frame_index);

            FrameVerdict verdict;
            verdict.index = frame.frame_index;
            verdict.timestamp = timestamps[frame.frame_index];
            verdict.probability = frame.probability;
            verdict.contributors = frame.contributors;
            report.frames.push_back(verdict);
        }

        report.statistics = analytics_.analyze(report.per_frame_confidence, frame_indices);
        report.per_backbone = std::move(results);
        report.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        report.peak_model_memory_mb = registry_->memory().get_peak_usage() / megabytes(1);

        std::cout << "Job " << job.id() << ": " << to_string(report.verdict)
                  << " p=" << format_probability(report.video_probability)
                  << " confidence=" << format_probability(report.overall_confidence)
                  << " in " << report.processing_time.count() << "ms" << std::endl;
        return report;
    }

    void run_inference(const VideoJob& job, const CancellationToken& cancel,
                       const std::vector<Frame>& frames,
                       std::vector<BackboneResult>& results,
                       std::vector<BackboneLease>& leases,
                       ProgressEmitter& emitter) {
        std::vector<size_t> active;
        for (size_t i = 0; i < results.size(); ++i) {
            if (leases[i]) {
                active.push_back(i);
            }
        }

        std::vector<std::future<InferenceRun>> futures;
        futures.reserve(active.size());
        for (size_t i : active) {
            const Backbone* backbone = leases[i].operator->();
            const auto launch = config_.parallel_inference ? std::launch::async : std::launch::deferred;
            futures.push_back(std::async(launch, [this, backbone, &frames, &cancel, &job]() {
                return score_frames(*backbone, frames, cancel, job.id());
            }));
        }

        std::exception_ptr first_error;
        size_t done = 0;
        for (size_t k = 0; k < active.size(); ++k) {
            BackboneResult& result = results[active[k]];
            try {
                InferenceRun run = futures[k].get();
                result.probabilities = std::move(run.probabilities);
                result.dropped_frames = std::move(run.dropped_frames);
                result.inference_duration = run.duration;

                if (run.failure) {
                    result.ready = false;
                    result.error = run.failure;
                    result.probabilities.clear();
                    registry_->mark_failed(result.name, *run.failure);
                }
            } catch (...) {
                // Keep collecting so no worker outlives this frame
                if (!first_error) {
                    first_error = std::current_exception();
                }
                continue;
            }

            ++done;
            std::string message = result.ready
                ? std::to_string(result.probabilities.size()) + "/" + std::to_string(frames.size()) +
                      " frames scored"
                : "failed: " + *result.error;
            emitter.backbone_inferred(result.name, done, active.size(), message);
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    static InferenceRun score_frames(const Backbone& backbone, const std::vector<Frame>& frames,
                                     const CancellationToken& cancel, const std::string& job_id) {
        auto start_time = std::chrono::steady_clock::now();
        InferenceRun run;
        run.probabilities.reserve(frames.size());

        for (const auto& frame : frames) {
            if (cancel.is_cancelled()) {
                throw JobCancelledError(job_id);
            }

            try {
                run.probabilities.push_back({frame.index, backbone.infer(frame)});
            } catch (const FrameInferenceError& e) {
                std::cout << "Dropping frame " << frame.index << " for " << backbone.name()
                          << ": " << e.what() << std::endl;
                run.dropped_frames.push_back(frame.index);
            } catch (const ShapeMismatchError& e) {
                std::cerr << "❌ " << e.what() << ", removing " << backbone.name()
                          << " from the ensemble" << std::endl;
                run.failure = e.what();
                break;
            } catch (const std::exception& e) {
                std::cerr << "❌ " << backbone.name() << " failed on frame " << frame.index
                          << ": " << e.what() << std::endl;
                run.failure = e.what();
                break;
            }
        }

        run.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return run;
    }

    void finish_job(const std::vector<std::string>& loaded) {
        if (!config_.unload_after_job) {
            return;
        }
        for (const auto& name : loaded) {
            registry_->unload(name);
        }
    }

    DetectionConfig config_;
    std::shared_ptr<ModelRegistry> registry_;
    ProgressChannel* progress_;
    FrameSampler sampler_;
    ConfidenceAnalytics analytics_;
};

DetectionPipeline::DetectionPipeline(DetectionConfig config,
                                     std::shared_ptr<ModelRegistry> registry,
                                     ProgressChannel* progress)
    : pimpl_(std::make_unique<Impl>(std::move(config), std::move(registry), progress)) {}

DetectionPipeline::~DetectionPipeline() = default;

DetectionReport DetectionPipeline::run(VideoJob& job, const CancellationToken& cancel) {
    return pimpl_->run(job, cancel);
}

DetectionReport DetectionPipeline::run(VideoJob& job) {
    CancellationToken never;
    return pimpl_->run(job, never);
}

VideoInfo DetectionPipeline::probe(const std::string& video_path) const {
    return pimpl_->probe(video_path);
}

std::vector<std::string> DetectionPipeline::ensemble() const {
    return pimpl_->ensemble();
}

const DetectionConfig& DetectionPipeline::config() const {
    return pimpl_->config();
}

ModelRegistry& DetectionPipeline::registry() {
    return pimpl_->registry();
}

} // namespace deepscan
