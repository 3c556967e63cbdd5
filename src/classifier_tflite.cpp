/**
 * @file classifier_tflite.cpp
 * @brief TensorFlow Lite gloss classifier backend
 *
 * Delegate probing follows the configured order (default GPU, XNNPACK,
 * CPU). Quantized (int8/uint8) models skip the GPU and NNAPI delegates,
 * which do not run them reliably.
 */

#include "signflow/classifier_tflite.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#ifdef HAVE_TFLITE
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>

#ifdef USE_XNNPACK
#include <tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h>
#endif

#ifdef USE_GPU_DELEGATE
#include <tensorflow/lite/delegates/gpu/delegate.h>
#endif
#endif

namespace signflow {
namespace tflite {

struct TFLiteClassifierImpl {
    bool initialized = false;
    ClassifierConfig config;
    std::string backend{"NONE"};
    std::string variant{"UNKNOWN"};
    size_t input_elements = 0;
    int gloss_output = 0;
    int origin_output = -1;
#ifdef HAVE_TFLITE
    using DelegatePtr = std::unique_ptr<TfLiteDelegate, void (*)(TfLiteDelegate*)>;
    std::unique_ptr<::tflite::FlatBufferModel> model;
    DelegatePtr delegate{nullptr, [](TfLiteDelegate*) {}};
    std::unique_ptr<::tflite::Interpreter> interpreter;   // destroyed before the delegate
#endif
};

namespace {

#ifdef HAVE_TFLITE

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_quantized(const TfLiteTensor* t) {
    return t->type == kTfLiteInt8 || t->type == kTfLiteUInt8;
}

size_t element_count(const TfLiteTensor* t) {
    size_t n = 1;
    for (int i = 0; i < t->dims->size; ++i) n *= static_cast<size_t>(std::max(1, t->dims->data[i]));
    return n;
}

std::vector<float> read_output(const TfLiteTensor* t) {
    size_t n = element_count(t);
    std::vector<float> out(n);
    switch (t->type) {
        case kTfLiteFloat32:
            std::copy(t->data.f, t->data.f + n, out.begin());
            break;
        case kTfLiteInt8:
            for (size_t i = 0; i < n; ++i)
                out[i] = (static_cast<float>(t->data.int8[i]) - t->params.zero_point) * t->params.scale;
            break;
        case kTfLiteUInt8:
            for (size_t i = 0; i < n; ++i)
                out[i] = (static_cast<float>(t->data.uint8[i]) - t->params.zero_point) * t->params.scale;
            break;
        default:
            out.clear();
            break;
    }
    return out;
}

// Builds a fresh interpreter and tries to attach the named delegate
bool build_interpreter(TFLiteClassifierImpl& impl, const std::string& delegate_name) {
    ::tflite::ops::builtin::BuiltinOpResolver resolver;
    std::unique_ptr<::tflite::Interpreter> interpreter;
    if (::tflite::InterpreterBuilder(*impl.model, resolver)(&interpreter) != kTfLiteOk || !interpreter) {
        std::cerr << "[TFLiteClassifier] Failed to build interpreter\n";
        return false;
    }
    interpreter->SetNumThreads(impl.config.num_threads);

    TFLiteClassifierImpl::DelegatePtr delegate{nullptr, [](TfLiteDelegate*) {}};
    bool quantized = !interpreter->inputs().empty() && is_quantized(interpreter->input_tensor(0));

    if (delegate_name == "GPU") {
        if (quantized) {
            if (impl.config.verbose) std::cerr << "[TFLiteClassifier] Skipping GPU delegate for quantized model\n";
            return false;
        }
#ifdef USE_GPU_DELEGATE
        TfLiteGpuDelegateOptionsV2 options = TfLiteGpuDelegateOptionsV2Default();
        delegate = TFLiteClassifierImpl::DelegatePtr(TfLiteGpuDelegateV2Create(&options), TfLiteGpuDelegateV2Delete);
#else
        return false;
#endif
    } else if (delegate_name == "XNNPACK") {
#ifdef USE_XNNPACK
        TfLiteXNNPackDelegateOptions options = TfLiteXNNPackDelegateOptionsDefault();
        options.num_threads = impl.config.num_threads;
        delegate = TFLiteClassifierImpl::DelegatePtr(TfLiteXNNPackDelegateCreate(&options), TfLiteXNNPackDelegateDelete);
#else
        return false;
#endif
    } else if (delegate_name == "NNAPI") {
        // Android only
        return false;
    } else if (delegate_name != "CPU") {
        std::cerr << "[TFLiteClassifier] Unknown delegate: " << delegate_name << "\n";
        return false;
    }

    if (delegate) {
        if (interpreter->ModifyGraphWithDelegate(delegate.get()) != kTfLiteOk) {
            std::cerr << "[TFLiteClassifier] " << delegate_name << " delegate rejected the model\n";
            interpreter.reset();   // before the delegate it references
            return false;
        }
    }
    if (interpreter->AllocateTensors() != kTfLiteOk) {
        std::cerr << "[TFLiteClassifier] Failed to allocate tensors with " << delegate_name << "\n";
        interpreter.reset();
        return false;
    }

    impl.interpreter.reset();
    impl.delegate = std::move(delegate);
    impl.interpreter = std::move(interpreter);
    impl.backend = delegate_name;
    return true;
}

#endif

} // namespace

TFLiteClassifierBackend::TFLiteClassifierBackend()
    : impl_(std::make_unique<TFLiteClassifierImpl>()) {
}

TFLiteClassifierBackend::~TFLiteClassifierBackend() = default;

bool TFLiteClassifierBackend::is_available() {
#ifdef HAVE_TFLITE
    return true;
#else
    return false;
#endif
}

std::string TFLiteClassifierBackend::backend_name() const {
    return impl_->backend;
}

std::string TFLiteClassifierBackend::model_variant() const {
    return impl_->variant;
}

bool TFLiteClassifierBackend::init(const ClassifierConfig& config, int window_frames, int frame_dims) {
    impl_->initialized = false;
    impl_->config = config;
#ifndef HAVE_TFLITE
    (void)window_frames;
    (void)frame_dims;
    std::cerr << "[TFLiteClassifier] Built without TensorFlow Lite support\n";
    return false;
#else
    if (config.model_path.empty()) {
        std::cerr << "[TFLiteClassifier] No model configured\n";
        return false;
    }
    impl_->model = ::tflite::FlatBufferModel::BuildFromFile(config.model_path.c_str());
    if (!impl_->model) {
        std::cerr << "[TFLiteClassifier] ERROR: failed to load model: " << config.model_path << "\n";
        return false;
    }

    bool built = false;
    for (const auto& name : config.delegate_order) {
        if (build_interpreter(*impl_, upper(name))) {
            built = true;
            break;
        }
    }
    if (!built && std::find(config.delegate_order.begin(), config.delegate_order.end(), "CPU") ==
                      config.delegate_order.end()) {
        // CPU is the guaranteed last resort even when not listed
        built = build_interpreter(*impl_, "CPU");
    }
    if (!built) {
        std::cerr << "[TFLiteClassifier] ERROR: no delegate could run the model\n";
        return false;
    }

    const TfLiteTensor* input = impl_->interpreter->input_tensor(0);
    impl_->input_elements = element_count(input);
    size_t expected = static_cast<size_t>(window_frames) * static_cast<size_t>(frame_dims);
    if (impl_->input_elements != expected) {
        std::cerr << "[TFLiteClassifier] ERROR: model expects " << impl_->input_elements
                  << " input values, window holds " << expected << "\n";
        return false;
    }

    if (is_quantized(input)) impl_->variant = "INT8";
    else if (lower(config.model_path).find("fp16") != std::string::npos) impl_->variant = "FP16";
    else impl_->variant = "FP32";

    // Output heads are identified by tensor name, falling back to position
    const auto& outputs = impl_->interpreter->outputs();
    impl_->gloss_output = 0;
    impl_->origin_output = outputs.size() > 1 ? 1 : -1;
    for (size_t i = 0; i < outputs.size(); ++i) {
        const TfLiteTensor* t = impl_->interpreter->output_tensor(i);
        std::string name = t->name ? lower(t->name) : std::string();
        if (name.find("gloss") != std::string::npos) impl_->gloss_output = static_cast<int>(i);
        else if (name.find("origin") != std::string::npos) impl_->origin_output = static_cast<int>(i);
    }
    if (impl_->origin_output == impl_->gloss_output) impl_->origin_output = -1;

    impl_->initialized = true;
    if (config.verbose) {
        std::cerr << "[TFLiteClassifier] Model " << config.model_path << " on " << impl_->backend
                  << " (" << impl_->variant << "), heads: " << (impl_->origin_output >= 0 ? 2 : 1) << "\n";
    }
    return true;
#endif
}

std::optional<RawOutput> TFLiteClassifierBackend::run(const FeatureWindow& window) {
#ifndef HAVE_TFLITE
    (void)window;
    return std::nullopt;
#else
    if (!impl_->initialized || !impl_->interpreter) {
        std::cerr << "[TFLiteClassifier] Interpreter not initialized\n";
        return std::nullopt;
    }
    if (window.data.size() != impl_->input_elements) {
        std::cerr << "[TFLiteClassifier] Window size " << window.data.size()
                  << " does not match model input " << impl_->input_elements << "\n";
        return std::nullopt;
    }

    TfLiteTensor* input = impl_->interpreter->input_tensor(0);
    switch (input->type) {
        case kTfLiteFloat32:
            std::copy(window.data.begin(), window.data.end(), input->data.f);
            break;
        case kTfLiteInt8:
            for (size_t i = 0; i < window.data.size(); ++i) {
                float q = std::round(window.data[i] / input->params.scale) + input->params.zero_point;
                input->data.int8[i] = static_cast<int8_t>(std::clamp(q, -128.0f, 127.0f));
            }
            break;
        case kTfLiteUInt8:
            for (size_t i = 0; i < window.data.size(); ++i) {
                float q = std::round(window.data[i] / input->params.scale) + input->params.zero_point;
                input->data.uint8[i] = static_cast<uint8_t>(std::clamp(q, 0.0f, 255.0f));
            }
            break;
        default:
            std::cerr << "[TFLiteClassifier] Unsupported input type\n";
            return std::nullopt;
    }

    if (impl_->interpreter->Invoke() != kTfLiteOk) {
        std::cerr << "[TFLiteClassifier] Inference failed\n";
        return std::nullopt;
    }

    RawOutput out;
    out.gloss_logits = read_output(impl_->interpreter->output_tensor(impl_->gloss_output));
    if (impl_->origin_output >= 0) {
        out.origin_logits = read_output(impl_->interpreter->output_tensor(impl_->origin_output));
    }
    if (out.gloss_logits.empty()) return std::nullopt;
    return out;
#endif
}

} // namespace tflite
} // namespace signflow
