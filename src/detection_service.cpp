#include "detection_service.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

namespace deepscan {

DetectionService::DetectionService(DetectionConfig config,
                                   std::shared_ptr<ModelRegistry> registry,
                                   ProgressChannel* progress,
                                   size_t history_limit)
    : registry_(registry ? std::move(registry) : std::make_shared<ModelRegistry>(config.registry))
    , workers_(std::make_shared<Workers>())
    , history_limit_(history_limit) {
    pipeline_ = std::make_shared<DetectionPipeline>(std::move(config), registry_, progress);
}

DetectionService::~DetectionService() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, handle] : jobs_) {
            if (!handle.job->is_terminal()) {
                handle.cancel->cancel();
            }
        }
    }

    std::unique_lock<std::mutex> lock(workers_->mutex);
    workers_->idle.wait(lock, [this]() { return workers_->running == 0; });
}

std::string DetectionService::next_job_id() {
    return "job-" + std::to_string(next_id_++);
}

void DetectionService::prune_finished_locked() {
    size_t finished = 0;
    for (const auto& [id, handle] : jobs_) {
        if (handle.job->is_terminal()) {
            ++finished;
        }
    }

    // Oldest first
    for (auto it = submission_order_.begin(); it != submission_order_.end() && finished > history_limit_;) {
        auto job = jobs_.find(*it);
        if (job != jobs_.end() && job->second.job->is_terminal()) {
            jobs_.erase(job);
            it = submission_order_.erase(it);
            --finished;
        } else {
            ++it;
        }
    }
}

std::future<DetectionReport> DetectionService::submit(const std::string& video_path,
                                                      std::string job_id,
                                                      int frame_count) {
    if (frame_count <= 0) {
        frame_count = pipeline_->config().frame_count;
    }

    JobHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job_id.empty()) {
            do {
                job_id = next_job_id();
            } while (jobs_.count(job_id) > 0);
        }

        auto it = jobs_.find(job_id);
        if (it != jobs_.end() && !it->second.job->is_terminal()) {
            throw ConfigError("Job '" + job_id + "' is still running");
        }

        if (it != jobs_.end()) {
            submission_order_.erase(
                std::remove(submission_order_.begin(), submission_order_.end(), job_id),
                submission_order_.end());
        }

        handle.job = std::make_shared<VideoJob>(job_id, video_path, frame_count);
        handle.cancel = std::make_shared<CancellationToken>();
        jobs_[job_id] = handle;
        submission_order_.push_back(job_id);
        prune_finished_locked();
    }

    std::cout << "Submitted job " << job_id << " for " << video_path << std::endl;

    {
        std::lock_guard<std::mutex> lock(workers_->mutex);
        ++workers_->running;
    }

    auto pipeline = pipeline_;
    auto workers = workers_;
    try {
        return std::async(std::launch::async, [pipeline, workers, handle]() {
            struct Done {
                std::shared_ptr<Workers> workers;
                ~Done() {
                    std::lock_guard<std::mutex> lock(workers->mutex);
                    --workers->running;
                    workers->idle.notify_all();
                }
            } done{workers};
            return pipeline->run(*handle.job, *handle.cancel);
        });
    } catch (const std::system_error&) {
        std::lock_guard<std::mutex> lock(workers_->mutex);
        --workers_->running;
        throw;
    }
}

bool DetectionService::cancel(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.job->is_terminal()) {
        return false;
    }
    it->second.cancel->cancel();
    return true;
}

std::optional<JobStatus> DetectionService::status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.job->status();
}

std::vector<std::string> DetectionService::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, handle] : jobs_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<BatchItem> DetectionService::run_batch(const std::vector<std::string>& video_paths,
                                                   size_t max_concurrent) {
    std::vector<BatchItem> items(video_paths.size());
    const size_t batch_size = std::max<size_t>(1, max_concurrent);

    std::cout << "Processing " << video_paths.size() << " videos in batches of "
              << batch_size << std::endl;

    for (size_t i = 0; i < video_paths.size(); i += batch_size) {
        size_t end_idx = std::min(i + batch_size, video_paths.size());

        std::vector<std::future<DetectionReport>> futures;
        for (size_t j = i; j < end_idx; ++j) {
            items[j].video_path = video_paths[j];
            futures.push_back(submit(video_paths[j]));
        }

        for (size_t j = i; j < end_idx; ++j) {
            try {
                items[j].report = futures[j - i].get();
                std::cout << "Completed: " << video_paths[j] << " ("
                          << to_string(items[j].report->verdict) << ")" << std::endl;
            } catch (const std::exception& e) {
                items[j].error = e.what();
                std::cout << "Failed: " << video_paths[j] << " (" << e.what() << ")" << std::endl;
            }
        }

        // Drop allocator scratch between batches
        registry_->memory().garbage_collect();
    }

    return items;
}

DetectionPipeline& DetectionService::pipeline() {
    return *pipeline_;
}

ModelRegistry& DetectionService::registry() {
    return *registry_;
}

} // namespace deepscan
