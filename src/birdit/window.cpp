//
//  window.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/window.h"

#include "birdit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace birdit {
namespace {

AudioWindow make_window(const std::vector<float>& signal,
                        std::size_t start,
                        std::size_t window_samples,
                        double sample_rate) {
    AudioWindow window;
    window.samples.assign(window_samples, 0.0f);
    const std::size_t available =
        start < signal.size() ? std::min(window_samples, signal.size() - start) : 0;
    std::copy(signal.begin() + static_cast<long>(start),
              signal.begin() + static_cast<long>(start + available),
              window.samples.begin());
    window.start_seconds = static_cast<double>(start) / sample_rate;
    window.end_seconds = static_cast<double>(start + window_samples) / sample_rate;
    return window;
}

} // namespace

bool compute_window_layout(double sample_rate,
                           double window_seconds,
                           double overlap_fraction,
                           WindowLayout* layout,
                           std::string* error) {
    if (!layout) {
        return false;
    }
    if (!(sample_rate > 0.0) || !std::isfinite(sample_rate)) {
        if (error) {
            *error = "Invalid sample rate.";
        }
        return false;
    }
    if (!(window_seconds > 0.0) || !std::isfinite(window_seconds)) {
        if (error) {
            *error = "Window length must be positive.";
        }
        return false;
    }
    if (!(overlap_fraction >= 0.0 && overlap_fraction < 1.0)) {
        if (error) {
            *error = "Overlap fraction must be in [0, 1).";
        }
        return false;
    }

    const double window = std::round(window_seconds * sample_rate);
    if (window < 1.0) {
        if (error) {
            *error = "Window is shorter than one sample.";
        }
        return false;
    }
    const double step = std::round(window * (1.0 - overlap_fraction));
    if (step < 1.0) {
        if (error) {
            *error = "Overlap fraction leaves a zero step between windows.";
        }
        return false;
    }

    layout->window_samples = static_cast<std::size_t>(window);
    layout->step_samples = static_cast<std::size_t>(step);
    return true;
}

std::size_t compute_window_count(std::size_t length,
                                 std::size_t window_samples,
                                 std::size_t step_samples) {
    if (window_samples == 0 || step_samples == 0 || length < window_samples) {
        return 0;
    }
    return (length - window_samples) / step_samples + 1;
}

bool segment_signal(const std::vector<float>& signal,
                    double sample_rate,
                    double window_seconds,
                    double overlap_fraction,
                    BirditConfig::TailPolicy tail_policy,
                    std::vector<AudioWindow>* out_windows,
                    std::string* error) {
    if (!out_windows) {
        return false;
    }
    out_windows->clear();

    WindowLayout layout;
    if (!compute_window_layout(sample_rate, window_seconds, overlap_fraction, &layout, error)) {
        return false;
    }
    if (signal.empty()) {
        return true;
    }

    const std::size_t window_samples = layout.window_samples;
    const std::size_t step_samples = layout.step_samples;

    if (signal.size() < window_samples) {
        // Zero padding keeps a single full-length window for short clips.
        out_windows->push_back(make_window(signal, 0, window_samples, sample_rate));
        BIRDIT_LOG_DEBUG("Window: padded " << signal.size() << " samples to "
                         << window_samples << ".");
        return true;
    }

    const std::size_t count = compute_window_count(signal.size(), window_samples, step_samples);
    out_windows->reserve(count + 1);
    for (std::size_t i = 0; i < count; ++i) {
        out_windows->push_back(make_window(signal, i * step_samples, window_samples, sample_rate));
    }

    const std::size_t covered = (count - 1) * step_samples + window_samples;
    if (covered < signal.size()) {
        if (tail_policy == BirditConfig::TailPolicy::PadAndKeep) {
            const std::size_t start = count * step_samples;
            AudioWindow tail = make_window(signal, start, window_samples, sample_rate);
            tail.end_seconds = static_cast<double>(signal.size()) / sample_rate;
            out_windows->push_back(std::move(tail));
        } else {
            BIRDIT_LOG_DEBUG("Window: dropped " << (signal.size() - covered)
                             << " trailing samples.");
        }
    }

    BIRDIT_LOG_DEBUG("Window: " << out_windows->size() << " windows of " << window_samples
                     << " samples, step " << step_samples << ".");
    return true;
}

} // namespace birdit
