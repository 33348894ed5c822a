#include <gtest/gtest.h>
#include "frame_sampler.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <opencv2/opencv.hpp>
#include <cstdio>
#include <fstream>
#include <memory>

namespace deepscan {

class FrameSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::write_test_video("sampler_video.avi", 50)) {
            FAIL() << "Could not create test video file";
        }
    }

    void TearDown() override {
        std::remove("sampler_video.avi");
        std::remove("sampler_empty.avi");
        std::remove("sampler_garbage.avi");
    }

    FrameSampler sampler_;
};

TEST_F(FrameSamplerTest, ProbeReportsContainerMetadata) {
    auto info = sampler_.probe("sampler_video.avi");

    EXPECT_EQ(info.total_frames, 50);
    EXPECT_NEAR(info.fps, 10.0, 0.01);
    EXPECT_NEAR(info.duration, 5.0, 0.1);
    EXPECT_EQ(info.frame_size, cv::Size(160, 120));
    EXPECT_EQ(info.codec, "MJPG");
}

TEST_F(FrameSamplerTest, SamplesRequestedCount) {
    auto frames = sampler_.sample("sampler_video.avi", 16);

    ASSERT_EQ(frames.size(), 16u);
    for (size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].index, i);
        EXPECT_FALSE(frames[i].pixels.empty());
        EXPECT_EQ(frames[i].pixels.type(), CV_8UC3);
    }
}

TEST_F(FrameSamplerTest, IncludesFirstAndLastFrame) {
    auto frames = sampler_.sample("sampler_video.avi", 8);

    ASSERT_EQ(frames.size(), 8u);
    EXPECT_EQ(frames.front().source_index, 0);
    EXPECT_EQ(frames.back().source_index, 49);
    EXPECT_NEAR(frames.back().timestamp, 4.9, 1e-6);
}

TEST_F(FrameSamplerTest, OrderedByTimestamp) {
    auto frames = sampler_.sample("sampler_video.avi", 12);

    for (size_t i = 1; i < frames.size(); ++i) {
        EXPECT_GT(frames[i].timestamp, frames[i - 1].timestamp);
        EXPECT_GT(frames[i].source_index, frames[i - 1].source_index);
    }
}

TEST_F(FrameSamplerTest, NeverPadsShortVideos) {
    ASSERT_TRUE(test::write_test_video("sampler_video.avi", 5));

    auto frames = sampler_.sample("sampler_video.avi", 16);
    EXPECT_EQ(frames.size(), 5u);
}

TEST_F(FrameSamplerTest, SingleFrameRequest) {
    auto frames = sampler_.sample("sampler_video.avi", 1);

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].source_index, 0);
}

TEST_F(FrameSamplerTest, DifferentFrameCounts) {
    std::vector<int> frame_counts = {1, 4, 8, 16, 32, 64};

    for (int count : frame_counts) {
        auto frames = sampler_.sample("sampler_video.avi", count);
        EXPECT_EQ(frames.size(), static_cast<size_t>(std::min(count, 50)));
    }
}

TEST_F(FrameSamplerTest, MissingFileIsDecodeError) {
    EXPECT_THROW(sampler_.sample("does_not_exist.avi", 8), DecodeError);
    EXPECT_THROW(sampler_.probe("does_not_exist.avi"), DecodeError);
}

TEST_F(FrameSamplerTest, GarbageFileIsFatal) {
    {
        std::ofstream out("sampler_garbage.avi", std::ios::binary);
        out << "this is not a video container";
    }

    EXPECT_THROW(sampler_.sample("sampler_garbage.avi", 8), DetectionError);
}

TEST_F(FrameSamplerTest, RejectsNonPositiveFrameCount) {
    EXPECT_THROW(sampler_.sample("sampler_video.avi", 0), ConfigError);
    EXPECT_THROW(sampler_.sample("sampler_video.avi", -3), ConfigError);
}

TEST(EvenIndicesTest, SpreadsOverWholeRange) {
    auto indices = FrameSampler::even_indices(100, 5);

    ASSERT_EQ(indices.size(), 5u);
    EXPECT_EQ(indices.front(), 0);
    EXPECT_EQ(indices.back(), 99);
    for (size_t i = 1; i < indices.size(); ++i) {
        EXPECT_GT(indices[i], indices[i - 1]);
    }
}

TEST(EvenIndicesTest, AllFramesWhenRequestExceedsTotal) {
    auto indices = FrameSampler::even_indices(4, 16);

    std::vector<int64_t> expected = {0, 1, 2, 3};
    EXPECT_EQ(indices, expected);
}

TEST(EvenIndicesTest, DegenerateInputs) {
    EXPECT_TRUE(FrameSampler::even_indices(0, 16).empty());
    EXPECT_TRUE(FrameSampler::even_indices(10, 0).empty());
    EXPECT_EQ(FrameSampler::even_indices(10, 1), std::vector<int64_t>{0});
}

namespace {

// Decodes `decodable` solid frames whose pixel value is the frame's position,
// while its header claims `reported`
class ScriptedSource : public FrameSource {
public:
    ScriptedSource(int64_t reported, int64_t decodable)
        : reported_(reported), decodable_(decodable) {}

    int64_t reported_frame_count() const override { return reported_; }
    double fps() const override { return 10.0; }
    double position_msec() const override { return position_ * 100.0; }

    bool grab() override {
        if (position_ + 1 >= decodable_) {
            position_ = decodable_;
            return false;
        }
        ++position_;
        return true;
    }

    bool retrieve(cv::Mat& pixels) override {
        pixels = cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(static_cast<double>(position_ % 256)));
        return true;
    }

private:
    int64_t reported_;
    int64_t decodable_;
    int64_t position_ = -1;
};

struct ScriptedVideo {
    int64_t reported = 0;
    int64_t decodable = 0;
    std::shared_ptr<int> opens = std::make_shared<int>(0);

    FrameSourceFactory factory() const {
        ScriptedVideo video = *this;
        return [video](const std::string&) -> std::unique_ptr<FrameSource> {
            ++*video.opens;
            return std::make_unique<ScriptedSource>(video.reported, video.decodable);
        };
    }
};

void expect_spans_stream(const std::vector<Frame>& frames, size_t expected, int64_t decodable) {
    ASSERT_EQ(frames.size(), expected);
    EXPECT_EQ(frames.front().source_index, 0);
    EXPECT_EQ(frames.back().source_index, decodable - 1);
    for (size_t i = 1; i < frames.size(); ++i) {
        EXPECT_GT(frames[i].timestamp, frames[i - 1].timestamp);
        EXPECT_EQ(frames[i].index, i);
    }
}

} // namespace

TEST(FrameSamplerRecountTest, AccurateHeaderReadsOnce) {
    ScriptedVideo video{40, 40};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.mkv", 16);
    expect_spans_stream(frames, 16, 40);
    EXPECT_EQ(*video.opens, 1);
}

TEST(FrameSamplerRecountTest, SingleFrameFromAccurateHeaderDoesNotRecount) {
    ScriptedVideo video{40, 40};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.mkv", 1);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].source_index, 0);
    EXPECT_EQ(*video.opens, 1);
}

TEST(FrameSamplerRecountTest, OverReportedCountIsRecounted) {
    ScriptedVideo video{40, 20};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.mkv", 16);
    expect_spans_stream(frames, 16, 20);
    EXPECT_EQ(*video.opens, 3);
}

TEST(FrameSamplerRecountTest, UnderReportedCountIsRecounted) {
    ScriptedVideo video{5, 40};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.webm", 16);
    expect_spans_stream(frames, 16, 40);
    // Pixel values carry the source position through decode
    EXPECT_EQ(frames.back().pixels.at<cv::Vec3b>(0, 0)[0], 39);
    EXPECT_EQ(*video.opens, 3);
}

TEST(FrameSamplerRecountTest, UnderReportedShortStreamReturnsEveryFrame) {
    ScriptedVideo video{5, 8};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.webm", 16);
    expect_spans_stream(frames, 8, 8);
}

TEST(FrameSamplerRecountTest, MissingCountIsRecounted) {
    ScriptedVideo video{0, 12};
    FrameSampler sampler(video.factory());

    auto frames = sampler.sample("scripted.webm", 4);
    expect_spans_stream(frames, 4, 12);
    EXPECT_EQ(*video.opens, 3);
}

TEST(FrameSamplerRecountTest, NothingDecodableIsEmptyVideo) {
    ScriptedVideo video{30, 0};
    FrameSampler sampler(video.factory());

    EXPECT_THROW(sampler.sample("scripted.webm", 4), EmptyVideoError);
}

} // namespace deepscan
