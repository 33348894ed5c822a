#include "inference_adapter.hpp"
#include "backbone.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace deepscan {

namespace {

// torchvision ImageNet statistics, RGB order
const cv::Scalar kImageNetMean(0.485, 0.456, 0.406);
const cv::Scalar kImageNetStd(0.229, 0.224, 0.225);

// OpenAI CLIP preprocessing statistics, RGB order
const cv::Scalar kClipMean(0.48145466, 0.4578275, 0.40821073);
const cv::Scalar kClipStd(0.26862954, 0.26130258, 0.27577711);

} // namespace

InputNormalization normalization_for(const BackboneDescriptor& descriptor) {
    InputNormalization norm;
    norm.size = descriptor.input_size;

    switch (descriptor.family) {
        case BackboneFamily::ResNet50:
        case BackboneFamily::EfficientNetB0:
        case BackboneFamily::ConvNeXtLarge:
        case BackboneFamily::ViTLarge:
        case BackboneFamily::SwinLarge:
            norm.mean = kImageNetMean;
            norm.stddev = kImageNetStd;
            break;
        case BackboneFamily::ClipViTB32:
            norm.mean = kClipMean;
            norm.stddev = kClipStd;
            break;
        case BackboneFamily::LaaNet:
            // Trained on raw [0, 1] pixels
            break;
    }
    return norm;
}

OutputHead output_head_for(BackboneFamily family) {
    switch (family) {
        case BackboneFamily::ConvNeXtLarge:
        case BackboneFamily::ViTLarge:
        case BackboneFamily::SwinLarge:
        case BackboneFamily::LaaNet:
            return OutputHead::SigmoidLogit;
        case BackboneFamily::ResNet50:
        case BackboneFamily::EfficientNetB0:
        case BackboneFamily::ClipViTB32:
            return OutputHead::SoftmaxFakeClass;
    }
    return OutputHead::SoftmaxFakeClass;
}

bool head_accepts_dimension(OutputHead head, size_t output_dim) {
    return head == OutputHead::SigmoidLogit ? output_dim == 1 : output_dim >= 2;
}

cv::Mat normalize_frame(const Frame& frame, const InputNormalization& norm,
                        const std::string& backbone) {
    const cv::Mat& pixels = frame.pixels;
    if (pixels.empty()) {
        throw FrameInferenceError(backbone, frame.index, "empty pixel buffer");
    }
    if (pixels.type() != CV_8UC3) {
        throw FrameInferenceError(backbone, frame.index,
                                  "expected 8-bit 3-channel pixels, got type " +
                                  std::to_string(pixels.type()));
    }

    cv::Mat resized;
    cv::resize(pixels, resized, norm.size, 0, 0, cv::INTER_LINEAR);

    if (norm.to_rgb) {
        cv::cvtColor(resized, resized, cv::COLOR_BGR2RGB);
    }

    cv::Mat float_image;
    resized.convertTo(float_image, CV_32FC3, norm.scale);

    cv::subtract(float_image, norm.mean, float_image);
    cv::divide(float_image, norm.stddev, float_image);
    return float_image;
}

std::vector<float> to_planar(const cv::Mat& normalized) {
    const int height = normalized.rows;
    const int width = normalized.cols;
    const size_t plane = static_cast<size_t>(height) * width;

    std::vector<float> data(plane * 3);
    std::vector<cv::Mat> channels;
    for (int c = 0; c < 3; ++c) {
        channels.emplace_back(height, width, CV_32FC1, data.data() + c * plane);
    }
    cv::split(normalized, channels);
    return data;
}

double sigmoid(double logit) {
    return 1.0 / (1.0 + std::exp(-logit));
}

double probability_from_output(const std::vector<float>& output, OutputHead head,
                               size_t declared_dim, const std::string& backbone) {
    if (output.size() != declared_dim) {
        throw ShapeMismatchError(backbone, declared_dim, output.size());
    }

    for (float value : output) {
        if (!std::isfinite(value)) {
            throw DetectionError("Backbone '" + backbone + "' produced a non-finite output");
        }
    }

    if (head == OutputHead::SigmoidLogit) {
        return sigmoid(output[0]);
    }

    // Softmax over all logits, probability of the fake class
    const float max_logit = *std::max_element(output.begin(), output.end());
    double sum = 0.0;
    for (float value : output) {
        sum += std::exp(static_cast<double>(value) - max_logit);
    }
    return std::exp(static_cast<double>(output[1]) - max_logit) / sum;
}

std::unique_ptr<Backbone> create_backbone(const BackboneDescriptor& descriptor,
                                          const InferenceOptions& options) {
    switch (descriptor.runtime) {
        case BackboneRuntime::TorchScript:
            return std::make_unique<TorchBackbone>(descriptor, options);
        case BackboneRuntime::Onnx:
            return std::make_unique<OnnxBackbone>(descriptor, options);
    }
    throw ConfigError("Unsupported runtime for backbone " + descriptor.name);
}

BackboneFactory default_backbone_factory(const InferenceOptions& options) {
    return [options](const BackboneDescriptor& descriptor) {
        return create_backbone(descriptor, options);
    };
}

} // namespace deepscan
