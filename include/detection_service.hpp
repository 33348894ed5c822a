#pragma once

#include "detection_pipeline.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deepscan {

struct BatchItem {
    std::string video_path;
    std::optional<DetectionReport> report;
    std::optional<std::string> error;
};

// Accepts jobs and runs each on its own thread through a shared pipeline.
// The most recent `history_limit` finished jobs stay queryable by id; older
// ones are dropped as new jobs arrive. Destruction cancels running jobs and
// waits for their threads.
class DetectionService {
public:
    DetectionService(DetectionConfig config,
                     std::shared_ptr<ModelRegistry> registry = nullptr,
                     ProgressChannel* progress = nullptr,
                     size_t history_limit = 64);
    ~DetectionService();

    DetectionService(const DetectionService&) = delete;
    DetectionService& operator=(const DetectionService&) = delete;

    // Empty `job_id` generates one; `frame_count` <= 0 uses the configured
    // default. Throws ConfigError for an id that is still running.
    std::future<DetectionReport> submit(const std::string& video_path,
                                        std::string job_id = "",
                                        int frame_count = 0);

    // False when the job is unknown or already finished
    bool cancel(const std::string& job_id);

    std::optional<JobStatus> status(const std::string& job_id) const;
    std::vector<std::string> jobs() const;

    // Runs every path, at most `max_concurrent` at a time. Failures are
    // reported per item rather than thrown.
    std::vector<BatchItem> run_batch(const std::vector<std::string>& video_paths,
                                     size_t max_concurrent = 2);

    DetectionPipeline& pipeline();
    ModelRegistry& registry();

private:
    struct JobHandle {
        std::shared_ptr<VideoJob> job;
        std::shared_ptr<CancellationToken> cancel;
    };

    // Worker threads outstanding; outlives the service if a thread lags
    struct Workers {
        std::mutex mutex;
        std::condition_variable idle;
        size_t running = 0;
    };

    std::string next_job_id();
    void prune_finished_locked();

    std::shared_ptr<ModelRegistry> registry_;
    std::shared_ptr<DetectionPipeline> pipeline_;
    std::shared_ptr<Workers> workers_;
    size_t history_limit_;

    mutable std::mutex mutex_;
    std::map<std::string, JobHandle> jobs_;
    std::deque<std::string> submission_order_;
    size_t next_id_ = 1;
};

} // namespace deepscan
