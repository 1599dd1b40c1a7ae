//
//  batch.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "birdit/config.h"
#include "birdit/detection.h"
#include "birdit/inference.h"
#include "birdit/labels.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace birdit {

/// @ingroup api
/// Why one input file contributed no detections.
struct FileFailure {
    std::string source_file;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/// @ingroup api
/// Timing breakdown accumulated over a batch.
struct PipelineTiming {
    double decode_ms = 0.0;
    double inference_ms = 0.0;
    double total_ms = 0.0;
    std::size_t windows = 0;
};

/**
 * @brief Result of a batch run.
 *
 * `ok == false` only for fail-fast errors (invalid configuration, missing
 * model); `error_kind` and `error` then describe the cause and nothing was
 * processed. Per-file failures leave `ok == true` and are listed in `failures`.
 */
struct BatchResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<Detection> detections;
    std::vector<FileFailure> failures;
    std::size_t files_total = 0;
    std::size_t files_succeeded = 0;
    PipelineTiming timing;
};

/// Called after each file with `(completed_files, total_files)`.
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

/**
 * @brief Runs decode, segmentation, inference and decoding over a list of files.
 *
 * The analyzer owns one backend for its lifetime; the backend and the label
 * catalog are only read. Detections are aggregated in input file order, then
 * window order, then class index.
 */
class BatchAnalyzer {
public:
    BatchAnalyzer(BirditConfig config,
                  LabelCatalog labels,
                  std::shared_ptr<InferenceBackend> backend);

    BatchResult run(const std::vector<std::string>& files,
                    const ProgressCallback& progress = {});

    /**
     * @brief Analyze one file, including timestamp enrichment.
     *
     * @return `false` with `failure` filled when the file cannot be decoded or
     *         inference fails; `out_detections` is then empty.
     */
    bool analyze_file(const std::string& path,
                      std::vector<Detection>* out_detections,
                      FileFailure* failure,
                      PipelineTiming* timing = nullptr);

    /**
     * @brief Segment, infer and decode an already decoded mono signal.
     *
     * `source_file` is copied into each detection; no timestamp enrichment.
     */
    bool analyze_samples(const std::vector<float>& samples,
                         const std::string& source_file,
                         std::vector<Detection>* out_detections,
                         ErrorKind* error_kind,
                         std::string* error,
                         PipelineTiming* timing = nullptr);

    const BirditConfig& config() const {
        return config_;
    }

    const LabelCatalog& labels() const {
        return labels_;
    }

private:
    BirditConfig config_;
    LabelCatalog labels_;
    std::shared_ptr<InferenceBackend> backend_;
};

/**
 * @brief Load the Torch model and labels from `config` and analyze `files`.
 *
 * Returns `ok == false` without touching any file when the configuration is
 * invalid or the model cannot be loaded.
 */
BatchResult analyze_files(const std::vector<std::string>& files,
                          const BirditConfig& config,
                          const ProgressCallback& progress = {});

} // namespace birdit
