#include "backbone.hpp"
#include "errors.hpp"
#include "inference_adapter.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>

namespace deepscan {

namespace {

// One environment per process, shared by every session
Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "deepscan");
    return env;
}

} // namespace

class OnnxBackbone::Impl {
public:
    Impl(const BackboneDescriptor& descriptor, const InferenceOptions& options)
        : descriptor_(descriptor)
        , options_(options)
        , norm_(normalization_for(descriptor))
        , head_(output_head_for(descriptor.family))
        , memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {}

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

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(std::max(1, options_.num_threads));
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        if (options_.use_gpu) {
            try {
                OrtCUDAProviderOptions cuda_options{};
                session_options.AppendExecutionProvider_CUDA(cuda_options);
                std::cout << "Using CUDA execution provider for " << descriptor_.name << std::endl;
            } catch (const Ort::Exception& e) {
                std::cout << "CUDA not available for " << descriptor_.name
                          << ", falling back to CPU: " << e.what() << std::endl;
            }
        }

        std::cout << "Loading ONNX backbone " << descriptor_.name << " from " << path << std::endl;

        try {
            session_ = std::make_unique<Ort::Session>(ort_env(), path.c_str(), session_options);
        } catch (const Ort::Exception& e) {
            // A protobuf that fails to parse is most often a partial download
            const bool transient = e.GetOrtErrorCode() == ORT_INVALID_PROTOBUF;
            throw BackboneLoadError(descriptor_.name, e.what(), transient);
        }

        try {
            read_io_names();
        } catch (const Ort::Exception& e) {
            release();
            throw BackboneLoadError(descriptor_.name, e.what(), false);
        } catch (const BackboneLoadError&) {
            release();
            throw;
        }
        loaded_ = true;
    }

    void release() {
        session_.reset();
        input_names_.clear();
        output_names_.clear();
        loaded_ = false;
    }

    bool is_loaded() const { return loaded_; }

    double infer(const Frame& frame) {
        if (!loaded_) {
            throw FrameInferenceError(descriptor_.name, frame.index, "backbone is not loaded");
        }

        cv::Mat input = normalize_frame(frame, norm_, descriptor_.name);
        std::vector<float> planar = to_planar(input);
        std::array<int64_t, 4> shape{1, 3, input.rows, input.cols};

        std::vector<float> values;
        try {
            Ort::Value tensor = Ort::Value::CreateTensor<float>(
                memory_info_, planar.data(), planar.size(), shape.data(), shape.size());

            const char* input_name = input_names_.front().c_str();
            const char* output_name = output_names_.front().c_str();

            auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                         &input_name, &tensor, 1,
                                         &output_name, 1);

            const auto& output = outputs.front();
            const float* data = output.GetTensorData<float>();
            const size_t count = output.GetTensorTypeAndShapeInfo().GetElementCount();
            values.assign(data, data + count);
        } catch (const Ort::Exception& e) {
            throw FrameInferenceError(descriptor_.name, frame.index, e.what());
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
    // Input layout comes from graph metadata, no forward pass involved
    void read_io_names() {
        Ort::AllocatorWithDefaultOptions allocator;

        if (session_->GetInputCount() < 1 || session_->GetOutputCount() < 1) {
            throw BackboneLoadError(descriptor_.name, "graph has no inputs or outputs", false);
        }

        input_names_.emplace_back(session_->GetInputNameAllocated(0, allocator).get());
        output_names_.emplace_back(session_->GetOutputNameAllocated(0, allocator).get());

        auto input_shape = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        const std::array<int64_t, 3> expected{3, descriptor_.input_size.height, descriptor_.input_size.width};

        bool matches = input_shape.size() == 4;
        for (size_t i = 0; matches && i < expected.size(); ++i) {
            // Negative dimensions are symbolic and accept anything
            const int64_t dim = input_shape[i + 1];
            matches = dim < 0 || dim == expected[i];
        }

        if (!matches) {
            std::string dims;
            for (auto d : input_shape) {
                dims += (dims.empty() ? "" : ", ") + std::to_string(d);
            }
            throw BackboneLoadError(descriptor_.name,
                "architecture mismatch, graph input is [" + dims + "]", false);
        }
    }

    BackboneDescriptor descriptor_;
    InferenceOptions options_;
    InputNormalization norm_;
    OutputHead head_;
    Ort::MemoryInfo memory_info_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    bool loaded_ = false;
};

OnnxBackbone::OnnxBackbone(BackboneDescriptor descriptor, const InferenceOptions& options)
    : Backbone(std::move(descriptor))
    , pimpl_(std::make_unique<Impl>(descriptor_, options)) {}

OnnxBackbone::~OnnxBackbone() = default;

void OnnxBackbone::load() {
    pimpl_->load();
}

void OnnxBackbone::release() {
    pimpl_->release();
}

bool OnnxBackbone::is_loaded() const {
    return pimpl_->is_loaded();
}

double OnnxBackbone::infer(const Frame& frame) const {
    return pimpl_->infer(frame);
}

} // namespace deepscan
