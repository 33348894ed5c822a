#include "detection_types.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace deepscan {

bool VideoJob::is_terminal() const {
    auto s = status();
    return s == JobStatus::Completed || s == JobStatus::Failed || s == JobStatus::Cancelled;
}

std::string to_string(BackboneFamily family) {
    switch (family) {
        case BackboneFamily::ResNet50: return "resnet50";
        case BackboneFamily::EfficientNetB0: return "efficientnet_b0";
        case BackboneFamily::ConvNeXtLarge: return "convnext_large";
        case BackboneFamily::ViTLarge: return "vit_large";
        case BackboneFamily::SwinLarge: return "swin_large";
        case BackboneFamily::ClipViTB32: return "clip_vit_b32";
        case BackboneFamily::LaaNet: return "laa_net";
    }
    return "unknown";
}

std::string to_string(BackboneRuntime runtime) {
    return runtime == BackboneRuntime::Onnx ? "onnx" : "torchscript";
}

std::string to_string(LoadState state) {
    switch (state) {
        case LoadState::Unloaded: return "unloaded";
        case LoadState::Loading: return "loading";
        case LoadState::Ready: return "ready";
        case LoadState::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::Fake: return "FAKE";
        case Verdict::Real: return "REAL";
        case Verdict::Suspicious: return "SUSPICIOUS";
    }
    return "SUSPICIOUS";
}

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Sampling: return "sampling";
        case JobStatus::Loading: return "loading";
        case JobStatus::Inferring: return "inferring";
        case JobStatus::Fusing: return "fusing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

BackboneFamily parse_backbone_family(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "resnet50" || v == "resnet") return BackboneFamily::ResNet50;
    if (v == "efficientnet_b0" || v == "efficientnet") return BackboneFamily::EfficientNetB0;
    if (v == "convnext_large" || v == "convnext") return BackboneFamily::ConvNeXtLarge;
    if (v == "vit_large" || v == "vit") return BackboneFamily::ViTLarge;
    if (v == "swin_large" || v == "swin") return BackboneFamily::SwinLarge;
    if (v == "clip_vit_b32" || v == "clip") return BackboneFamily::ClipViTB32;
    if (v == "laa_net" || v == "laa") return BackboneFamily::LaaNet;
    throw ConfigError("Unknown backbone family: " + value);
}

BackboneRuntime parse_backbone_runtime(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "torchscript" || v == "torch" || v == "pt") return BackboneRuntime::TorchScript;
    if (v == "onnx") return BackboneRuntime::Onnx;
    throw ConfigError("Unknown backbone runtime: " + value);
}

} // namespace deepscan
