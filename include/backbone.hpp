#pragma once

#include "config.hpp"
#include "detection_types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace deepscan {

// One ensemble member. Adapters own their input normalization and run in
// evaluation mode only.
class Backbone {
public:
    explicit Backbone(BackboneDescriptor descriptor) : descriptor_(std::move(descriptor)) {}
    virtual ~Backbone() = default;

    Backbone(const Backbone&) = delete;
    Backbone& operator=(const Backbone&) = delete;

    // Deserializes weights and places the model on its device.
    // Throws BackboneLoadError.
    virtual void load() = 0;
    virtual void release() = 0;
    virtual bool is_loaded() const = 0;

    // Fake probability in [0, 1] for one frame. Throws FrameInferenceError for
    // a frame that cannot be scored and ShapeMismatchError when the output
    // does not match the declared dimension.
    virtual double infer(const Frame& frame) const = 0;

    const BackboneDescriptor& descriptor() const { return descriptor_; }
    const std::string& name() const { return descriptor_.name; }

protected:
    BackboneDescriptor descriptor_;
};

using BackboneFactory = std::function<std::unique_ptr<Backbone>(const BackboneDescriptor&)>;

// LibTorch TorchScript archive
class TorchBackbone : public Backbone {
public:
    TorchBackbone(BackboneDescriptor descriptor, const InferenceOptions& options);
    ~TorchBackbone() override;

    void load() override;
    void release() override;
    bool is_loaded() const override;
    double infer(const Frame& frame) const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ONNX Runtime session
class OnnxBackbone : public Backbone {
public:
    OnnxBackbone(BackboneDescriptor descriptor, const InferenceOptions& options);
    ~OnnxBackbone() override;

    void load() override;
    void release() override;
    bool is_loaded() const override;
    double infer(const Frame& frame) const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

std::unique_ptr<Backbone> create_backbone(const BackboneDescriptor& descriptor,
                                          const InferenceOptions& options);

// Factory bound to a fixed set of inference options
BackboneFactory default_backbone_factory(const InferenceOptions& options);

} // namespace deepscan
