#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace deepscan {

struct ProgressEvent {
    std::string job_id;
    std::string stage;
    double percent = 0.0;
    std::string message;
    std::optional<double> eta_seconds;
};

nlohmann::json to_json(const ProgressEvent& event);

// Unbounded multi-producer FIFO between running jobs and whoever reports on
// them. Publishing never waits for a consumer or for the listener.
class ProgressChannel {
public:
    using Listener = std::function<void(const ProgressEvent&)>;

    ProgressChannel() = default;
    explicit ProgressChannel(Listener listener);
    // Closes the channel and delivers what the listener has not seen yet
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Dropped silently once the channel is closed
    void publish(ProgressEvent event);

    std::optional<ProgressEvent> try_pop();
    // Returns nullopt on timeout or when closed and empty
    std::optional<ProgressEvent> wait_pop(std::chrono::milliseconds timeout);
    std::vector<ProgressEvent> drain();

    // Returns after the listener has seen every event published before it
    void close();
    bool closed() const;
    size_t size() const;

    // Receives every event in publish order on a dispatcher thread owned by
    // the channel, independently of the queue consumers
    void set_listener(Listener listener);

private:
    void dispatch();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;

    Listener listener_;
    std::deque<ProgressEvent> undelivered_;
    std::condition_variable dispatch_cv_;
    std::thread dispatcher_;
};

namespace stage {
inline const std::string kSampling = "sampling";
inline const std::string kLoadingModel = "loading_model:";
inline const std::string kInferring = "inferring:";
inline const std::string kFusing = "fusing";
inline const std::string kCompleted = "completed";
inline const std::string kFailed = "failed";
} // namespace stage

// Per-job view of a channel. Maps stages onto percent bands and estimates
// the remaining time from what has elapsed so far. A null channel makes
// every call a no-op.
class ProgressEmitter {
public:
    ProgressEmitter(ProgressChannel* channel, std::string job_id);

    void sampling(const std::string& message);
    // `done` of `total` backbones finished loading, including this one
    void model_loaded(const std::string& name, size_t done, size_t total, const std::string& message);
    void backbone_inferred(const std::string& name, size_t done, size_t total, const std::string& message);
    void fusing(const std::string& message);
    void completed(const std::string& message);
    void failed(const std::string& message);

    double last_percent() const { return last_percent_; }

private:
    void emit(const std::string& stage, double percent, const std::string& message);
    std::optional<double> estimate_eta(double percent) const;

    ProgressChannel* channel_;
    std::string job_id_;
    std::chrono::steady_clock::time_point start_;
    double last_percent_ = 0.0;
};

} // namespace deepscan
