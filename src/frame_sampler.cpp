#include "frame_sampler.hpp"
#include "errors.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace deepscan {

namespace {

cv::VideoCapture open_capture(const std::string& video_path) {
    cv::VideoCapture cap;
    try {
        cap.open(video_path);
    } catch (const cv::Exception& e) {
        throw DecodeError("Failed to open video: " + video_path + " (" + e.what() + ")");
    }
    if (!cap.isOpened()) {
        throw DecodeError("Failed to open video: " + video_path);
    }
    return cap;
}

class VideoCaptureSource : public FrameSource {
public:
    explicit VideoCaptureSource(cv::VideoCapture cap) : cap_(std::move(cap)) {}

    int64_t reported_frame_count() const override {
        return static_cast<int64_t>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
    }
    double fps() const override { return cap_.get(cv::CAP_PROP_FPS); }
    bool grab() override { return cap_.grab(); }
    bool retrieve(cv::Mat& pixels) override { return cap_.retrieve(pixels); }
    double position_msec() const override { return cap_.get(cv::CAP_PROP_POS_MSEC); }

private:
    cv::VideoCapture cap_;
};

} // namespace

std::unique_ptr<FrameSource> open_video_capture(const std::string& video_path) {
    return std::make_unique<VideoCaptureSource>(open_capture(video_path));
}

class FrameSampler::Impl {
public:
    struct ReadOutcome {
        std::vector<Frame> frames;
        int64_t frames_walked = 0;
        bool stream_ended_early = false;
    };

    explicit Impl(FrameSourceFactory open_source) : open_source_(std::move(open_source)) {
        if (!open_source_) {
            open_source_ = open_video_capture;
        }
    }

    std::unique_ptr<FrameSource> open(const std::string& video_path) const {
        auto source = open_source_(video_path);
        if (!source) {
            throw DecodeError("Failed to open video: " + video_path);
        }
        return source;
    }

    // Frame counts in container headers are estimates; this one is exact
    int64_t count_decodable(const std::string& video_path) const {
        auto source = open(video_path);
        int64_t count = 0;
        while (source->grab()) {
            ++count;
        }
        return count;
    }

    // Walks the stream sequentially and decodes only the requested indices.
    // Sequential grab avoids inaccurate seeking on inter-coded streams.
    ReadOutcome read_targets(FrameSource& source, const std::vector<int64_t>& targets) const {
        ReadOutcome outcome;
        outcome.frames.reserve(targets.size());

        const double fps = source.fps();
        size_t next = 0;
        int64_t position = 0;

        while (next < targets.size()) {
            if (!source.grab()) {
                outcome.stream_ended_early = true;
                break;
            }

            if (position == targets[next]) {
                cv::Mat pixels;
                if (source.retrieve(pixels) && !pixels.empty()) {
                    Frame frame;
                    frame.index = outcome.frames.size();
                    frame.source_index = position;
                    frame.timestamp = fps > 0.0
                        ? static_cast<double>(position) / fps
                        : source.position_msec() / 1000.0;
                    frame.pixels = pixels.clone();
                    outcome.frames.push_back(std::move(frame));
                } else {
                    std::cout << "Skipping undecodable frame " << position << std::endl;
                }
                ++next;
            }
            ++position;
        }

        outcome.frames_walked = position;
        return outcome;
    }

    std::vector<Frame> sample(const std::string& video_path, int frame_count) const {
        if (frame_count < 1) {
            throw ConfigError("frame_count must be at least 1, got " + std::to_string(frame_count));
        }

        auto source = open(video_path);
        const int64_t reported = source->reported_frame_count();

        std::cout << "Sampling " << frame_count << " frames from " << video_path
                  << " (reported frames: " << reported << ")" << std::endl;

        if (reported > 0) {
            auto outcome = read_targets(*source, even_indices(reported, frame_count));
            bool shorter = outcome.stream_ended_early;
            for (int64_t walked = outcome.frames_walked; !shorter && walked < reported; ++walked) {
                shorter = !source->grab();
            }

            if (shorter) {
                std::cout << "Stream shorter than reported, recounting frames" << std::endl;
            } else if (source->grab()) {
                // A frame past the reported count means the header undercounts
                std::cout << "Stream longer than reported, recounting frames" << std::endl;
            } else {
                return finish(video_path, std::move(outcome.frames));
            }
        }
        source.reset();

        const int64_t decodable = count_decodable(video_path);
        if (decodable == 0) {
            throw EmptyVideoError("No decodable frames in video: " + video_path);
        }

        auto second = open(video_path);
        auto outcome = read_targets(*second, even_indices(decodable, frame_count));
        return finish(video_path, std::move(outcome.frames));
    }

private:
    std::vector<Frame> finish(const std::string& video_path, std::vector<Frame> frames) const {
        if (frames.empty()) {
            throw EmptyVideoError("No decodable frames in video: " + video_path);
        }
        std::cout << "Sampled " << frames.size() << " frames" << std::endl;
        return frames;
    }

    FrameSourceFactory open_source_;
};

FrameSampler::FrameSampler(FrameSourceFactory open_source)
    : pimpl_(std::make_unique<Impl>(std::move(open_source))) {}

FrameSampler::~FrameSampler() = default;

VideoInfo FrameSampler::probe(const std::string& video_path) const {
    cv::VideoCapture cap = open_capture(video_path);

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? info.total_frames / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

std::vector<Frame> FrameSampler::sample(const std::string& video_path, int frame_count) const {
    return pimpl_->sample(video_path, frame_count);
}

std::vector<int64_t> FrameSampler::even_indices(int64_t total, int frame_count) {
    std::vector<int64_t> indices;
    if (total <= 0 || frame_count < 1) {
        return indices;
    }

    if (frame_count >= total) {
        indices.resize(static_cast<size_t>(total));
        std::iota(indices.begin(), indices.end(), 0);
        return indices;
    }

    if (frame_count == 1) {
        indices.push_back(0);
        return indices;
    }

    indices.reserve(static_cast<size_t>(frame_count));
    const double step = static_cast<double>(total - 1) / (frame_count - 1);
    for (int i = 0; i < frame_count; ++i) {
        indices.push_back(static_cast<int64_t>(std::llround(i * step)));
    }
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

} // namespace deepscan
