//
//  detection.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "birdit/labels.h"
#include "birdit/window.h"

#include <string>
#include <vector>

namespace birdit {

/**
 * @brief One species detection within one window.
 *
 * `start_time` / `end_time` are seconds relative to the start of `source_file`.
 * `timestamp_str` (`YYYYMMDD_HHMMSS`) is the recording start parsed from the
 * file name and `absolute_start` (`YYYY-MM-DD HH:MM:SS.mmm`) the wall-clock
 * start of the detection; both stay empty when `has_timestamp == false`.
 */
struct Detection {
    std::string species;
    float confidence = 0.0f;
    double start_time = 0.0;
    double end_time = 0.0;
    double duration = 0.0;
    std::string source_file;
    std::string timestamp_str;
    std::string absolute_start;
    bool has_timestamp = false;
};

/// @brief Logistic squashing of a raw classifier score into `(0, 1)`.
float sigmoid(float score);

/**
 * @brief Turn raw per-window scores into thresholded detections.
 *
 * Windows are visited in order and, within a window, classes by ascending
 * index. A class is kept when `sigmoid(score) >= min_confidence`.
 *
 * @param scores One raw score vector per window.
 * @param windows Windows matching `scores` one to one.
 * @param labels Catalog used to name class indices.
 * @param min_confidence Inclusive confidence threshold.
 * @param out_detections Receives the detections; `source_file` is left empty.
 * @param error Message when `scores` and `windows` disagree in count.
 */
bool decode_detections(const std::vector<std::vector<float>>& scores,
                       const std::vector<AudioWindow>& windows,
                       const LabelCatalog& labels,
                       float min_confidence,
                       std::vector<Detection>* out_detections,
                       std::string* error);

} // namespace birdit
