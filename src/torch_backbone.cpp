#include "backbone.hpp"
#include "errors.hpp"
#include "inference_adapter.hpp"
#include <torch/torch.h>
#include <torch/script.h>
#include <filesystem>
#include <iostream>

namespace deepscan {

namespace {

// Errors raised while reading the zip container of a TorchScript archive
// usually mean the file is still being written or was cut short
bool is_transient_archive_error(const std::string& message) {
    return message.find("PytorchStreamReader") != std::string::npos ||
           message.find("central directory") != std::string::npos ||
           message.find("Unexpected EOF") != std::string::npos ||
           message.find("truncated") != std::string::npos;
}

} // namespace

class TorchBackbone::Impl {
public:
    Impl(const BackboneDescriptor& descriptor, const InferenceOptions& options)
        : descriptor_(descriptor)
        , norm_(normalization_for(descriptor))
        , head_(output_head_for(descriptor.family))
        , device_(torch::kCPU) {
        if (options.use_gpu && torch::cuda::is_available()) {
            device_ = torch::Device(torch::kCUDA);
        }
    }

    void load() {
        const std::string& path = descriptor_.weights_path;
        if (!head_accepts_dimension(head_, descriptor_.output_dim)) {
            throw BackboneLoadError(descriptor_.name,
                "declared output_dim " + std::to_string(descriptor_.output_dim) +
                " does not fit the " + to_string(descriptor_.family) + " head", false);
        }
        if (!std::filesystem::exists(path)) {
            throw BackboneLoadError(descriptor_.name, "weights not found at " + path, false);
        }

        std::cout << "Loading TorchScript backbone " << descriptor_.name
                  << " from " << path << " on "
                  << (device_.is_cuda() ? "CUDA" : "CPU") << std::endl;

        try {
            module_ = torch::jit::load(path, device_);
        } catch (const c10::Error& e) {
            const std::string message = e.what_without_backtrace();
            throw BackboneLoadError(descriptor_.name, message, is_transient_archive_error(message));
        } catch (const std::ios_base::failure& e) {
            throw BackboneLoadError(descriptor_.name, e.what(), true);
        }

        if (!module_.find_method("forward")) {
            throw BackboneLoadError(descriptor_.name, "archive has no forward method", false);
        }

        module_.eval();
        loaded_ = true;
    }

    void release() {
        module_ = torch::jit::Module();
        loaded_ = false;
    }

    bool is_loaded() const { return loaded_; }

    double infer(const Frame& frame) {
        if (!loaded_) {
            throw FrameInferenceError(descriptor_.name, frame.index, "backbone is not loaded");
        }

        cv::Mat input = normalize_frame(frame, norm_, descriptor_.name);

        std::vector<float> values;
        try {
            torch::NoGradGuard no_grad;

            auto tensor = torch::from_blob(input.data, {1, input.rows, input.cols, 3}, torch::kFloat32)
                              .permute({0, 3, 1, 2})
                              .contiguous()
                              .to(device_);

            torch::jit::IValue output = module_.forward({tensor});
            torch::Tensor logits = output.isTuple()
                ? output.toTuple()->elements().at(0).toTensor()
                : output.toTensor();

            logits = logits.to(torch::kCPU, torch::kFloat32).contiguous().flatten();
            values.assign(logits.data_ptr<float>(), logits.data_ptr<float>() + logits.numel());
        } catch (const c10::Error& e) {
            throw FrameInferenceError(descriptor_.name, frame.index, e.what_without_backtrace());
        }

        try {
            return probability_from_output(values, head_, descriptor_.output_dim, descriptor_.name);
        } catch (const ShapeMismatchError&) {
            throw;
        } catch (const DetectionError& e) {
            throw FrameInferenceError(descriptor_.name, frame.index, e.what());
        }
    }

private:
    BackboneDescriptor descriptor_;
    InputNormalization norm_;
    OutputHead head_;
    torch::Device device_;
    torch::jit::Module module_;
    bool loaded_ = false;
};

TorchBackbone::TorchBackbone(BackboneDescriptor descriptor, const InferenceOptions& options)
    : Backbone(std::move(descriptor))
    , pimpl_(std::make_unique<Impl>(descriptor_, options)) {}

TorchBackbone::~TorchBackbone() = default;

void TorchBackbone::load() {
    pimpl_->load();
}

void TorchBackbone::release() {
    pimpl_->release();
}

bool TorchBackbone::is_loaded() const {
    return pimpl_->is_loaded();
}

double TorchBackbone::infer(const Frame& frame) const {
    return pimpl_->infer(frame);
}

} // namespace deepscan
