#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace deepscan {

// Base for every error raised by the detection pipeline
class DetectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Container or codec could not be opened. Fatal to the job.
class DecodeError : public DetectionError {
public:
    using DetectionError::DetectionError;
};

// Video opened but no frame could be decoded. Fatal to the job.
class EmptyVideoError : public DetectionError {
public:
    using DetectionError::DetectionError;
};

// A backbone failed to load. Degrades the ensemble, never fatal on its own.
class BackboneLoadError : public DetectionError {
public:
    BackboneLoadError(const std::string& backbone, const std::string& message, bool transient)
        : DetectionError("Failed to load backbone '" + backbone + "': " + message)
        , backbone_(backbone)
        , transient_(transient) {}

    const std::string& backbone() const noexcept { return backbone_; }

    // Transient failures (I/O, truncated archive) are worth retrying
    bool transient() const noexcept { return transient_; }

private:
    std::string backbone_;
    bool transient_;
};

// Inference produced an output whose size differs from the declared dimension
class ShapeMismatchError : public DetectionError {
public:
    ShapeMismatchError(const std::string& backbone, size_t expected, size_t actual)
        : DetectionError("Backbone '" + backbone + "' produced " + std::to_string(actual) +
                         " output values, declared " + std::to_string(expected))
        , backbone_(backbone)
        , expected_(expected)
        , actual_(actual) {}

    const std::string& backbone() const noexcept { return backbone_; }
    size_t expected() const noexcept { return expected_; }
    size_t actual() const noexcept { return actual_; }

private:
    std::string backbone_;
    size_t expected_;
    size_t actual_;
};

// One frame could not be scored by one backbone. The data point is dropped.
class FrameInferenceError : public DetectionError {
public:
    FrameInferenceError(const std::string& backbone, size_t frame_index, const std::string& message)
        : DetectionError("Backbone '" + backbone + "' failed on frame " +
                         std::to_string(frame_index) + ": " + message)
        , backbone_(backbone)
        , frame_index_(frame_index) {}

    const std::string& backbone() const noexcept { return backbone_; }
    size_t frame_index() const noexcept { return frame_index_; }

private:
    std::string backbone_;
    size_t frame_index_;
};

// Every backbone failed, nothing left to fuse
class NoModelsAvailableError : public DetectionError {
public:
    using DetectionError::DetectionError;
};

class ConfigError : public DetectionError {
public:
    using DetectionError::DetectionError;
};

class JobCancelledError : public DetectionError {
public:
    explicit JobCancelledError(const std::string& job_id)
        : DetectionError("Job '" + job_id + "' was cancelled") {}
};

} // namespace deepscan
