//
//  window.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "birdit/config.h"

#include <cstddef>
#include <string>
#include <vector>

namespace birdit {

/// @brief One classifier input: exactly `window_samples` samples plus its file-relative span.
struct AudioWindow {
    std::vector<float> samples;
    double start_seconds = 0.0;
    double end_seconds = 0.0;
};

/// @brief Window length and stride in samples derived from seconds and overlap.
struct WindowLayout {
    std::size_t window_samples = 0;
    std::size_t step_samples = 0;
};

/**
 * @brief Resolve window length and stride.
 *
 * `window_samples = round(window_seconds * sample_rate)`,
 * `step_samples = round(window_samples * (1 - overlap_fraction))`.
 *
 * @return `false` for a non-positive rate or length, an overlap outside `[0, 1)`,
 *         or a stride that rounds to zero.
 */
bool compute_window_layout(double sample_rate,
                           double window_seconds,
                           double overlap_fraction,
                           WindowLayout* layout,
                           std::string* error);

/// @brief Number of full windows, `floor((length - window) / step) + 1`, `0` if none fit.
std::size_t compute_window_count(std::size_t length,
                                 std::size_t window_samples,
                                 std::size_t step_samples);

/**
 * @brief Slice a mono signal into fixed-length windows.
 *
 * A signal shorter than one window is zero-padded to exactly one window. With
 * `TailPolicy::Drop` a trailing remainder shorter than a window is discarded;
 * with `TailPolicy::PadAndKeep` it becomes one zero-padded window whose end is
 * clamped to the signal end. An empty signal yields no windows.
 *
 * @param signal Mono samples at `sample_rate`.
 * @param sample_rate Sample rate of `signal` in Hz.
 * @param window_seconds Window length in seconds.
 * @param overlap_fraction Fraction of a window shared with its successor.
 * @param tail_policy Handling of the final partial window.
 * @param out_windows Windows ordered by start offset.
 * @param error Message for invalid parameters.
 */
bool segment_signal(const std::vector<float>& signal,
                    double sample_rate,
                    double window_seconds,
                    double overlap_fraction,
                    BirditConfig::TailPolicy tail_policy,
                    std::vector<AudioWindow>* out_windows,
                    std::string* error);

} // namespace birdit
