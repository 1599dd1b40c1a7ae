//
//  config.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>

namespace birdit {

/**
 * @brief Runtime configuration for segmentation, inference and decoding.
 *
 * Defaults match the Perch bird vocalization classifier (5 s windows at 32 kHz).
 */
struct BirditConfig {
    std::string model_path = "models/perch.pt";
    std::string labels_path = "perch_labels.csv";
    // Scanned recursively for a `label.csv` when `labels_path` does not exist.
    std::string labels_search_dir;
    std::string label_column = "ebird2021";
    std::size_t class_count = 11000;
    std::size_t sample_rate = 32000;
    double window_seconds = 5.0;
    double overlap_fraction = 0.0;
    float min_confidence = 0.1f;
    enum class TailPolicy {
        Drop,
        PadAndKeep,
    };
    TailPolicy tail_policy = TailPolicy::Drop;
    std::string torch_device = "cpu";
    std::size_t torch_batch_size = 1;
    bool has_location = false;
    double latitude = 0.0;
    double longitude = 0.0;
    // `YYYY-MM-DD`, empty for year-round inference.
    std::string reference_date;
    bool verbose = false;
    bool profile = false;
};

/// @brief Error classes surfaced by the pipeline.
enum class ErrorKind {
    None,
    LabelLoadDegraded,
    AudioDecodeFailed,
    ModelUnavailable,
    InferenceFailed,
    InvalidConfiguration,
};

const char* error_kind_name(ErrorKind kind);

/**
 * @brief Check a configuration before any file is processed.
 *
 * @return `false` with a short message in `error` for an unusable configuration.
 */
bool validate_config(const BirditConfig& config, std::string* error);

/**
 * @brief Map `reference_date` onto the 48-week calendar used by location-aware models.
 *
 * Every month has four weeks; day 29 and later fold into week four.
 *
 * @return Week index in `1..48`, `-1` for an empty date, `0` for a malformed one.
 */
int reference_week(const std::string& reference_date);

} // namespace birdit
