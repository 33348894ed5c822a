#include "progress_channel.hpp"
#include <algorithm>
#include <iostream>

namespace deepscan {

namespace {

constexpr double kSamplingEnd = 10.0;
constexpr double kLoadingEnd = 40.0;
constexpr double kInferringEnd = 90.0;
constexpr double kFusingStart = 90.0;

double band(double begin, double end, size_t done, size_t total) {
    if (total == 0) {
        return end;
    }
    const double fraction = std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
    return begin + (end - begin) * fraction;
}

} // namespace

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json j = {
        {"job_id", event.job_id},
        {"stage", event.stage},
        {"percent", event.percent},
        {"message", event.message}
    };
    if (event.eta_seconds) {
        j["eta_seconds"] = *event.eta_seconds;
    } else {
        j["eta_seconds"] = nullptr;
    }
    return j;
}

// ProgressChannel

ProgressChannel::ProgressChannel(Listener listener) {
    set_listener(std::move(listener));
}

ProgressChannel::~ProgressChannel() {
    close();
}

void ProgressChannel::publish(ProgressEvent event) {
    bool notify_listener = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (listener_) {
            undelivered_.push_back(event);
            notify_listener = true;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    if (notify_listener) {
        dispatch_cv_.notify_one();
    }
}

void ProgressChannel::dispatch() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        dispatch_cv_.wait(lock, [this] { return !undelivered_.empty() || closed_; });
        if (undelivered_.empty()) {
            return;
        }

        ProgressEvent event = std::move(undelivered_.front());
        undelivered_.pop_front();
        Listener listener = listener_;

        lock.unlock();
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "Progress listener failed on " << event.stage << ": " << e.what() << std::endl;
        }
        lock.lock();
    }
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> result(std::make_move_iterator(events_.begin()),
                                      std::make_move_iterator(events_.end()));
    events_.clear();
    return result;
}

void ProgressChannel::close() {
    std::thread dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dispatcher = std::move(dispatcher_);
    }
    cv_.notify_all();
    dispatch_cv_.notify_all();

    if (!dispatcher.joinable()) {
        return;
    }
    if (dispatcher.get_id() == std::this_thread::get_id()) {
        // Closed from inside the listener; the loop ends once it catches up
        dispatcher.detach();
    } else {
        dispatcher.join();
    }
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void ProgressChannel::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!listener) {
        return;
    }
    listener_ = std::move(listener);
    if (!dispatcher_.joinable() && !closed_) {
        dispatcher_ = std::thread(&ProgressChannel::dispatch, this);
    }
}

// ProgressEmitter

ProgressEmitter::ProgressEmitter(ProgressChannel* channel, std::string job_id)
    : channel_(channel)
    , job_id_(std::move(job_id))
    , start_(std::chrono::steady_clock::now()) {}

void ProgressEmitter::sampling(const std::string& message) {
    emit(stage::kSampling, kSamplingEnd, message);
}

void ProgressEmitter::model_loaded(const std::string& name, size_t done, size_t total,
                                   const std::string& message) {
    emit(stage::kLoadingModel + name, band(kSamplingEnd, kLoadingEnd, done, total), message);
}

void ProgressEmitter::backbone_inferred(const std::string& name, size_t done, size_t total,
                                        const std::string& message) {
    emit(stage::kInferring + name, band(kLoadingEnd, kInferringEnd, done, total), message);
}

void ProgressEmitter::fusing(const std::string& message) {
    emit(stage::kFusing, kFusingStart, message);
}

void ProgressEmitter::completed(const std::string& message) {
    emit(stage::kCompleted, 100.0, message);
}

void ProgressEmitter::failed(const std::string& message) {
    // A failure keeps the percentage reached so far
    emit(stage::kFailed, last_percent_, message);
}

void ProgressEmitter::emit(const std::string& stage, double percent, const std::string& message) {
    // Concurrent inference may finish out of order; never report going backwards
    percent = std::max(percent, last_percent_);
    last_percent_ = percent;

    if (!channel_) {
        return;
    }

    ProgressEvent event;
    event.job_id = job_id_;
    event.stage = stage;
    event.percent = percent;
    event.message = message;
    if (stage != stage::kFailed) {
        event.eta_seconds = estimate_eta(percent);
    }
    channel_->publish(std::move(event));
}

std::optional<double> ProgressEmitter::estimate_eta(double percent) const {
    if (percent >= 100.0) {
        return 0.0;
    }
    if (percent <= 0.0) {
        return std::nullopt;
    }
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    return elapsed * (100.0 - percent) / percent;
}

} // namespace deepscan
