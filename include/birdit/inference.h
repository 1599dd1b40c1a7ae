//
//  inference.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "birdit/config.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace birdit {

struct InferenceTiming {
    double forward_ms = 0.0;
    std::size_t forward_calls = 0;
};

/**
 * @brief Multi-label acoustic classifier over fixed-length waveform windows.
 *
 * Implementations return raw (unsquashed) per-class scores, one vector per
 * window, in input order. An instance is read-only once constructed.
 */
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    /// @brief Windows per forward call; callers chunk larger batches.
    virtual std::size_t max_batch_size(const BirditConfig& config) const = 0;

    /// @brief Output width when known, `0` otherwise.
    virtual std::size_t class_count() const = 0;

    virtual bool infer_window(const std::vector<float>& window,
                              const BirditConfig& config,
                              std::vector<float>* scores,
                              InferenceTiming* timing) = 0;

    virtual bool infer_windows(const std::vector<std::vector<float>>& windows,
                               const BirditConfig& config,
                               std::vector<std::vector<float>>* scores,
                               InferenceTiming* timing);
};

/**
 * @brief Load the TorchScript classifier named by `config.model_path`.
 *
 * @return `nullptr` with `error` set when the model cannot be loaded.
 */
std::unique_ptr<InferenceBackend> make_torch_inference_backend(const BirditConfig& config,
                                                               std::string* error);

} // namespace birdit
