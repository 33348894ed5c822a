#pragma once

#include "detection_types.hpp"
#include <opencv2/opencv.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace deepscan {

// Sequential decoder the sampler walks. The default wraps cv::VideoCapture.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Header estimate; may be missing (<= 0), too high or too low
    virtual int64_t reported_frame_count() const = 0;
    virtual double fps() const = 0;
    virtual bool grab() = 0;
    virtual bool retrieve(cv::Mat& pixels) = 0;
    virtual double position_msec() const = 0;
};

// Opens a fresh source positioned at the first frame; throws DecodeError
using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>(const std::string&)>;

std::unique_ptr<FrameSource> open_video_capture(const std::string& video_path);

class FrameSampler {
public:
    explicit FrameSampler(FrameSourceFactory open_source = open_video_capture);
    ~FrameSampler();

    // Container metadata as reported by the decoder
    VideoInfo probe(const std::string& video_path) const;

    // Up to `frame_count` frames spread evenly over the video, first and last
    // included when possible, ordered by timestamp. Never pads.
    std::vector<Frame> sample(const std::string& video_path, int frame_count) const;

    // Evenly spaced indices in [0, total) with both ends included
    static std::vector<int64_t> even_indices(int64_t total, int frame_count);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace deepscan
