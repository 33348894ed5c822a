#include <gtest/gtest.h>
#include "backbone.hpp"
#include "inference_adapter.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <opencv2/opencv.hpp>
#include <cmath>

namespace deepscan {

class InferenceAdapterTest : public ::testing::Test {
protected:
    Frame make_frame(cv::Scalar bgr, cv::Size size = cv::Size(64, 48)) {
        Frame frame;
        frame.index = 3;
        frame.pixels = cv::Mat(size, CV_8UC3, bgr);
        return frame;
    }

    BackboneDescriptor descriptor(BackboneFamily family, cv::Size size = cv::Size(224, 224)) {
        BackboneDescriptor d = test::make_descriptor("adapter");
        d.family = family;
        d.input_size = size;
        return d;
    }
};

TEST_F(InferenceAdapterTest, ImageNetFamiliesShareStatistics) {
    for (auto family : {BackboneFamily::ResNet50, BackboneFamily::EfficientNetB0,
                        BackboneFamily::ConvNeXtLarge, BackboneFamily::ViTLarge,
                        BackboneFamily::SwinLarge}) {
        auto norm = normalization_for(descriptor(family));
        EXPECT_NEAR(norm.mean[0], 0.485, 1e-9) << to_string(family);
        EXPECT_NEAR(norm.stddev[2], 0.225, 1e-9) << to_string(family);
        EXPECT_TRUE(norm.to_rgb);
    }
}

TEST_F(InferenceAdapterTest, ClipUsesItsOwnStatistics) {
    auto norm = normalization_for(descriptor(BackboneFamily::ClipViTB32));
    EXPECT_NEAR(norm.mean[0], 0.48145466, 1e-9);
    EXPECT_NEAR(norm.stddev[0], 0.26862954, 1e-9);
}

TEST_F(InferenceAdapterTest, LaaNetUsesRawUnitRange) {
    auto norm = normalization_for(descriptor(BackboneFamily::LaaNet, cv::Size(384, 384)));
    EXPECT_EQ(norm.size, cv::Size(384, 384));
    EXPECT_DOUBLE_EQ(norm.mean[0], 0.0);
    EXPECT_DOUBLE_EQ(norm.stddev[0], 1.0);
}

TEST_F(InferenceAdapterTest, OutputHeadsPerFamily) {
    EXPECT_EQ(output_head_for(BackboneFamily::ResNet50), OutputHead::SoftmaxFakeClass);
    EXPECT_EQ(output_head_for(BackboneFamily::EfficientNetB0), OutputHead::SoftmaxFakeClass);
    EXPECT_EQ(output_head_for(BackboneFamily::ClipViTB32), OutputHead::SoftmaxFakeClass);
    EXPECT_EQ(output_head_for(BackboneFamily::ConvNeXtLarge), OutputHead::SigmoidLogit);
    EXPECT_EQ(output_head_for(BackboneFamily::ViTLarge), OutputHead::SigmoidLogit);
    EXPECT_EQ(output_head_for(BackboneFamily::SwinLarge), OutputHead::SigmoidLogit);
    EXPECT_EQ(output_head_for(BackboneFamily::LaaNet), OutputHead::SigmoidLogit);
}

TEST_F(InferenceAdapterTest, HeadDimensionRules) {
    EXPECT_TRUE(head_accepts_dimension(OutputHead::SigmoidLogit, 1));
    EXPECT_FALSE(head_accepts_dimension(OutputHead::SigmoidLogit, 2));
    EXPECT_TRUE(head_accepts_dimension(OutputHead::SoftmaxFakeClass, 2));
    EXPECT_FALSE(head_accepts_dimension(OutputHead::SoftmaxFakeClass, 1));
}

TEST_F(InferenceAdapterTest, NormalizeResizesAndConvertsToRgb) {
    // Pure blue in BGR
    Frame frame = make_frame(cv::Scalar(255, 0, 0));
    InputNormalization norm;
    norm.size = cv::Size(32, 16);

    cv::Mat out = normalize_frame(frame, norm, "adapter");

    EXPECT_EQ(out.type(), CV_32FC3);
    EXPECT_EQ(out.size(), cv::Size(32, 16));
    auto pixel = out.at<cv::Vec3f>(8, 16);
    EXPECT_NEAR(pixel[0], 0.0f, 1e-6);
    EXPECT_NEAR(pixel[1], 0.0f, 1e-6);
    EXPECT_NEAR(pixel[2], 1.0f, 1e-6);
}

TEST_F(InferenceAdapterTest, NormalizeAppliesMeanAndStd) {
    Frame frame = make_frame(cv::Scalar(255, 255, 255));
    auto norm = normalization_for(descriptor(BackboneFamily::ResNet50, cv::Size(8, 8)));

    cv::Mat out = normalize_frame(frame, norm, "adapter");
    auto pixel = out.at<cv::Vec3f>(0, 0);

    EXPECT_NEAR(pixel[0], (1.0 - 0.485) / 0.229, 1e-4);
    EXPECT_NEAR(pixel[1], (1.0 - 0.456) / 0.224, 1e-4);
    EXPECT_NEAR(pixel[2], (1.0 - 0.406) / 0.225, 1e-4);
}

TEST_F(InferenceAdapterTest, MalformedFramesAreFrameErrors) {
    InputNormalization norm;

    Frame empty;
    empty.index = 7;
    try {
        normalize_frame(empty, norm, "adapter");
        FAIL() << "expected FrameInferenceError";
    } catch (const FrameInferenceError& e) {
        EXPECT_EQ(e.frame_index(), 7u);
        EXPECT_EQ(e.backbone(), "adapter");
    }

    Frame gray;
    gray.pixels = cv::Mat(10, 10, CV_8UC1, cv::Scalar(10));
    EXPECT_THROW(normalize_frame(gray, norm, "adapter"), FrameInferenceError);
}

TEST_F(InferenceAdapterTest, PlanarLayoutIsChannelMajor) {
    cv::Mat image(2, 3, CV_32FC3, cv::Scalar(1.0f, 2.0f, 3.0f));
    auto planar = to_planar(image);

    ASSERT_EQ(planar.size(), 18u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_FLOAT_EQ(planar[i], 1.0f);
        EXPECT_FLOAT_EQ(planar[6 + i], 2.0f);
        EXPECT_FLOAT_EQ(planar[12 + i], 3.0f);
    }
}

TEST_F(InferenceAdapterTest, SoftmaxPicksFakeClass) {
    double p = probability_from_output({0.0f, 0.0f}, OutputHead::SoftmaxFakeClass, 2, "adapter");
    EXPECT_NEAR(p, 0.5, 1e-9);

    p = probability_from_output({0.0f, std::log(9.0f)}, OutputHead::SoftmaxFakeClass, 2, "adapter");
    EXPECT_NEAR(p, 0.9, 1e-6);

    // Large logits must not overflow
    p = probability_from_output({1000.0f, 1000.0f}, OutputHead::SoftmaxFakeClass, 2, "adapter");
    EXPECT_NEAR(p, 0.5, 1e-9);
}

TEST_F(InferenceAdapterTest, SigmoidHead) {
    EXPECT_NEAR(probability_from_output({0.0f}, OutputHead::SigmoidLogit, 1, "adapter"), 0.5, 1e-9);
    EXPECT_NEAR(sigmoid(std::log(3.0)), 0.75, 1e-9);
}

TEST_F(InferenceAdapterTest, WrongElementCountIsShapeMismatch) {
    try {
        probability_from_output(std::vector<float>(1000, 0.0f), OutputHead::SoftmaxFakeClass, 2, "resnet50");
        FAIL() << "expected ShapeMismatchError";
    } catch (const ShapeMismatchError& e) {
        EXPECT_EQ(e.expected(), 2u);
        EXPECT_EQ(e.actual(), 1000u);
        EXPECT_EQ(e.backbone(), "resnet50");
    }
}

TEST_F(InferenceAdapterTest, NonFiniteOutputIsRejected) {
    EXPECT_THROW(probability_from_output({std::nanf("")}, OutputHead::SigmoidLogit, 1, "adapter"),
                 DetectionError);
}

TEST_F(InferenceAdapterTest, FactorySelectsRuntime) {
    InferenceOptions options;
    options.use_gpu = false;

    auto torch_descriptor = descriptor(BackboneFamily::ResNet50);
    torch_descriptor.runtime = BackboneRuntime::TorchScript;
    auto torch_backbone = create_backbone(torch_descriptor, options);
    EXPECT_NE(dynamic_cast<TorchBackbone*>(torch_backbone.get()), nullptr);
    EXPECT_FALSE(torch_backbone->is_loaded());

    auto onnx_descriptor = descriptor(BackboneFamily::ClipViTB32);
    onnx_descriptor.runtime = BackboneRuntime::Onnx;
    auto onnx_backbone = default_backbone_factory(options)(onnx_descriptor);
    EXPECT_NE(dynamic_cast<OnnxBackbone*>(onnx_backbone.get()), nullptr);
}

TEST_F(InferenceAdapterTest, MissingWeightsArePermanentLoadErrors) {
    InferenceOptions options;
    options.use_gpu = false;

    for (auto runtime : {BackboneRuntime::TorchScript, BackboneRuntime::Onnx}) {
        auto d = descriptor(BackboneFamily::ResNet50);
        d.runtime = runtime;
        d.weights_path = "no_such_weights.bin";
        auto backbone = create_backbone(d, options);

        try {
            backbone->load();
            FAIL() << "expected BackboneLoadError";
        } catch (const BackboneLoadError& e) {
            EXPECT_FALSE(e.transient()) << to_string(runtime);
        }
        EXPECT_FALSE(backbone->is_loaded());
    }
}

TEST_F(InferenceAdapterTest, HeadMismatchRejectedAtLoad) {
    InferenceOptions options;
    options.use_gpu = false;

    // A sigmoid family declaring two outputs never gets as far as the file
    auto d = descriptor(BackboneFamily::ConvNeXtLarge);
    d.output_dim = 2;
    auto backbone = create_backbone(d, options);

    try {
        backbone->load();
        FAIL() << "expected BackboneLoadError";
    } catch (const BackboneLoadError& e) {
        EXPECT_FALSE(e.transient());
    }
}

TEST_F(InferenceAdapterTest, UnloadedBackboneRejectsInference) {
    InferenceOptions options;
    options.use_gpu = false;
    auto backbone = create_backbone(descriptor(BackboneFamily::ResNet50), options);

    Frame frame = make_frame(cv::Scalar(0, 0, 0));
    EXPECT_THROW(backbone->infer(frame), DetectionError);
}

} // namespace deepscan
