//
//  backend_torch.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/inference.h"

#include "birdit/logging.hpp"
#include "birdit/window.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <c10/core/InferenceMode.h>
#include <torch/cuda.h>
#include <torch/script.h>

namespace birdit {
namespace {

constexpr const char* kMetadataMethod = "forward_with_metadata";

std::string first_line(const std::string& message) {
    const std::size_t newline = message.find('\n');
    return newline == std::string::npos ? message : message.substr(0, newline);
}

bool extract_logits_tensor(const torch::IValue& output, torch::Tensor* logits) {
    if (!logits) {
        return false;
    }
    *logits = torch::Tensor();

    if (output.isTensor()) {
        *logits = output.toTensor();
    } else if (output.isTuple()) {
        const auto tuple = output.toTuple();
        const auto& elements = tuple->elements();
        if (!elements.empty() && elements[0].isTensor()) {
            *logits = elements[0].toTensor();
        }
    } else if (output.isGenericDict()) {
        auto dict = output.toGenericDict();
        for (const char* key : {"output_0", "logits", "label"}) {
            if (dict.contains(key) && dict.at(key).isTensor()) {
                *logits = dict.at(key).toTensor();
                break;
            }
        }
    }

    if (!logits->defined()) {
        BIRDIT_LOG_ERROR("Torch backend: unexpected output signature.");
        return false;
    }
    return true;
}

class TorchInferenceBackend final : public InferenceBackend {
public:
    std::size_t max_batch_size(const BirditConfig& config) const override {
        return std::max<std::size_t>(1, config.torch_batch_size);
    }

    std::size_t class_count() const override {
        return class_count_;
    }

    bool load(const BirditConfig& config, std::string* error) {
        if (config.model_path.empty()) {
            if (error) {
                *error = "missing model path";
            }
            return false;
        }

        device_ = torch::kCPU;
        if (config.torch_device == "cuda") {
            if (torch::cuda::is_available()) {
                device_ = torch::kCUDA;
            } else {
                BIRDIT_LOG_WARN("Torch backend: CUDA unavailable, falling back to cpu.");
            }
        } else if (config.torch_device != "cpu") {
            BIRDIT_LOG_WARN("Torch backend: unknown device '" << config.torch_device
                            << "', using cpu.");
        }

        try {
            module_ = torch::jit::load(config.model_path, torch::kCPU);
            module_.eval();
            module_.to(torch::kFloat32);
            if (device_.type() != torch::kCPU) {
                try {
                    module_.to(device_);
                } catch (const c10::Error& err) {
                    BIRDIT_LOG_WARN("Torch backend: device move failed, falling back to cpu: "
                                    << first_line(err.what()));
                    device_ = torch::kCPU;
                }
            }
        } catch (const c10::Error& err) {
            if (error) {
                *error = "failed to load model " + config.model_path + ": " +
                         first_line(err.what());
            }
            return false;
        }

        has_metadata_method_ = module_.find_method(kMetadataMethod).has_value();
        if (config.has_location && !has_metadata_method_) {
            BIRDIT_LOG_DEBUG("Torch backend: model has no " << kMetadataMethod
                             << ", location and date are ignored.");
        }

        WindowLayout layout;
        std::string layout_error;
        if (!compute_window_layout(static_cast<double>(config.sample_rate),
                                   config.window_seconds,
                                   config.overlap_fraction,
                                   &layout,
                                   &layout_error)) {
            if (error) {
                *error = layout_error;
            }
            return false;
        }

        // A silent probe window validates the signature and reveals the output width.
        std::vector<float> probe(layout.window_samples, 0.0f);
        std::vector<float> scores;
        if (!infer_window(probe, config, &scores, nullptr) || scores.empty()) {
            if (error) {
                *error = "model " + config.model_path + " failed the probe forward pass";
            }
            return false;
        }
        class_count_ = scores.size();

        BIRDIT_LOG_DEBUG("Torch backend: resolved device=" << device_.str()
                         << " classes=" << class_count_
                         << " metadata=" << (has_metadata_method_ ? "yes" : "no"));
        return true;
    }

    bool infer_window(const std::vector<float>& window,
                      const BirditConfig& config,
                      std::vector<float>* scores,
                      InferenceTiming* timing) override {
        if (!scores) {
            return false;
        }
        std::vector<std::vector<float>> batch_scores;
        if (!run_batch({window}, config, &batch_scores, timing) || batch_scores.size() != 1) {
            return false;
        }
        *scores = std::move(batch_scores.front());
        return true;
    }

    bool infer_windows(const std::vector<std::vector<float>>& windows,
                       const BirditConfig& config,
                       std::vector<std::vector<float>>* scores,
                       InferenceTiming* timing) override {
        if (!scores) {
            return false;
        }
        scores->clear();
        if (windows.empty()) {
            return true;
        }
        return run_batch(windows, config, scores, timing);
    }

private:
    bool run_batch(const std::vector<std::vector<float>>& windows,
                   const BirditConfig& config,
                   std::vector<std::vector<float>>* scores,
                   InferenceTiming* timing) {
        const std::size_t batch = windows.size();
        const std::size_t samples = windows.front().size();
        if (samples == 0) {
            BIRDIT_LOG_ERROR("Torch backend: empty window.");
            return false;
        }

        std::vector<float> batch_buffer(batch * samples, 0.0f);
        for (std::size_t b = 0; b < batch; ++b) {
            if (windows[b].size() != samples) {
                BIRDIT_LOG_ERROR("Torch backend: windows in one batch differ in length.");
                return false;
            }
            std::copy(windows[b].begin(),
                      windows[b].end(),
                      batch_buffer.begin() + static_cast<long>(b * samples));
        }

        torch::Tensor logits;
        try {
            c10::InferenceMode inference_guard(true);
            const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device_);
            torch::Tensor input =
                torch::from_blob(batch_buffer.data(),
                                 {static_cast<long long>(batch), static_cast<long long>(samples)},
                                 torch::kFloat32)
                    .to(options)
                    .clone();

            std::vector<torch::IValue> inputs;
            inputs.emplace_back(input);

            const auto forward_start = std::chrono::steady_clock::now();
            torch::IValue output;
            if (config.has_location && has_metadata_method_) {
                const auto batch_size = static_cast<long long>(batch);
                inputs.emplace_back(torch::full({batch_size},
                                                static_cast<float>(config.latitude),
                                                options));
                inputs.emplace_back(torch::full({batch_size},
                                                static_cast<float>(config.longitude),
                                                options));
                inputs.emplace_back(torch::full({batch_size},
                                                static_cast<float>(
                                                    reference_week(config.reference_date)),
                                                options));
                output = module_.get_method(kMetadataMethod)(inputs);
            } else {
                output = module_.forward(inputs);
            }
            const auto forward_end = std::chrono::steady_clock::now();
            if (timing) {
                timing->forward_ms +=
                    std::chrono::duration<double, std::milli>(forward_end - forward_start).count();
                timing->forward_calls += 1;
            }

            if (!extract_logits_tensor(output, &logits)) {
                return false;
            }
            if (logits.dim() == 1) {
                logits = logits.unsqueeze(0);
            }
            if (logits.dim() == 3 && logits.size(1) == 1) {
                logits = logits.squeeze(1);
            }
            if (logits.dim() != 2 || static_cast<std::size_t>(logits.size(0)) != batch) {
                BIRDIT_LOG_ERROR("Torch backend: unexpected logits shape " << logits.sizes()
                                 << " for batch " << batch << ".");
                return false;
            }
            logits = logits.to(torch::kCPU).to(torch::kFloat32).contiguous();
        } catch (const c10::Error& err) {
            BIRDIT_LOG_ERROR("Torch backend: forward failed: " << first_line(err.what()));
            return false;
        } catch (const std::exception& err) {
            BIRDIT_LOG_ERROR("Torch backend: forward exception: " << err.what());
            return false;
        }

        const std::size_t classes = static_cast<std::size_t>(logits.size(1));
        const auto accessor = logits.accessor<float, 2>();
        scores->assign(batch, {});
        for (std::size_t b = 0; b < batch; ++b) {
            (*scores)[b].resize(classes);
            for (std::size_t c = 0; c < classes; ++c) {
                (*scores)[b][c] =
                    accessor[static_cast<long long>(b)][static_cast<long long>(c)];
            }
        }
        return true;
    }

    torch::jit::script::Module module_;
    torch::Device device_ = torch::kCPU;
    std::size_t class_count_ = 0;
    bool has_metadata_method_ = false;
};

} // namespace

std::unique_ptr<InferenceBackend> make_torch_inference_backend(const BirditConfig& config,
                                                               std::string* error) {
    auto backend = std::make_unique<TorchInferenceBackend>();
    std::string load_error;
    if (!backend->load(config, &load_error)) {
        BIRDIT_LOG_ERROR("Torch backend: " << load_error);
        if (error) {
            *error = load_error;
        }
        return nullptr;
    }
    return backend;
}

} // namespace birdit
