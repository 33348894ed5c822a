#pragma once

#include "detection_types.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace deepscan {

// How a family expects its pixels: size, channel order, value range and
// per-channel statistics of its training distribution.
struct InputNormalization {
    cv::Size size{224, 224};
    bool to_rgb = true;
    double scale = 1.0 / 255.0;
    cv::Scalar mean{0.0, 0.0, 0.0};
    cv::Scalar stddev{1.0, 1.0, 1.0};
};

enum class OutputHead {
    SoftmaxFakeClass, // logits over [real, fake, ...], class 1 is fake
    SigmoidLogit      // single logit
};

InputNormalization normalization_for(const BackboneDescriptor& descriptor);
OutputHead output_head_for(BackboneFamily family);

// Output dimension a head can work with; used to reject a descriptor at load
bool head_accepts_dimension(OutputHead head, size_t output_dim);

// Resized, colour-converted, standardized CV_32FC3 image (HWC).
// Throws FrameInferenceError for empty or non 8-bit 3-channel input.
cv::Mat normalize_frame(const Frame& frame, const InputNormalization& norm,
                        const std::string& backbone);

// Planar CHW copy of a normalized image
std::vector<float> to_planar(const cv::Mat& normalized);

// Maps raw model output to a fake probability. Throws ShapeMismatchError when
// the element count differs from the declared dimension.
double probability_from_output(const std::vector<float>& output, OutputHead head,
                               size_t declared_dim, const std::string& backbone);

double sigmoid(double logit);

} // namespace deepscan
