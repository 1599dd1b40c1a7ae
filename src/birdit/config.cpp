//
//  config.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/config.h"

#include <cctype>
#include <cmath>
#include <sstream>

namespace birdit {
namespace {

bool fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

bool parse_digits(const std::string& text, std::size_t offset, std::size_t count, int* value) {
    int parsed = 0;
    for (std::size_t i = offset; i < offset + count; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        parsed = parsed * 10 + (ch - '0');
    }
    *value = parsed;
    return true;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::LabelLoadDegraded:
            return "label-load-degraded";
        case ErrorKind::AudioDecodeFailed:
            return "audio-decode-failed";
        case ErrorKind::ModelUnavailable:
            return "model-unavailable";
        case ErrorKind::InferenceFailed:
            return "inference-failed";
        case ErrorKind::InvalidConfiguration:
            return "invalid-configuration";
    }
    return "unknown";
}

int reference_week(const std::string& reference_date) {
    if (reference_date.empty()) {
        return -1;
    }
    if (reference_date.size() != 10 || reference_date[4] != '-' || reference_date[7] != '-') {
        return 0;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_digits(reference_date, 0, 4, &year) ||
        !parse_digits(reference_date, 5, 2, &month) ||
        !parse_digits(reference_date, 8, 2, &day)) {
        return 0;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return 0;
    }
    const int week_in_month = day >= 29 ? 4 : (day - 1) / 7 + 1;
    return (month - 1) * 4 + week_in_month;
}

bool validate_config(const BirditConfig& config, std::string* error) {
    if (config.sample_rate == 0) {
        return fail(error, "sample_rate must be positive.");
    }
    if (!std::isfinite(config.window_seconds) || config.window_seconds <= 0.0) {
        return fail(error, "window_seconds must be positive.");
    }
    if (!std::isfinite(config.overlap_fraction) || config.overlap_fraction < 0.0 ||
        config.overlap_fraction >= 1.0) {
        return fail(error, "overlap_fraction must be in [0, 1).");
    }

    const double window_samples =
        std::round(config.window_seconds * static_cast<double>(config.sample_rate));
    if (window_samples < 1.0) {
        return fail(error, "window_seconds is shorter than one sample.");
    }
    const double step_samples = std::round(window_samples * (1.0 - config.overlap_fraction));
    if (step_samples < 1.0) {
        std::ostringstream message;
        message << "overlap_fraction " << config.overlap_fraction
                << " leaves no step between windows.";
        return fail(error, message.str());
    }

    if (!std::isfinite(config.min_confidence) || config.min_confidence < 0.0f ||
        config.min_confidence > 1.0f) {
        return fail(error, "min_confidence must be in [0, 1].");
    }
    if (config.torch_batch_size == 0) {
        return fail(error, "torch_batch_size must be at least 1.");
    }
    if (config.has_location) {
        if (!std::isfinite(config.latitude) || config.latitude < -90.0 || config.latitude > 90.0) {
            return fail(error, "latitude must be in [-90, 90].");
        }
        if (!std::isfinite(config.longitude) || config.longitude < -180.0 ||
            config.longitude > 180.0) {
            return fail(error, "longitude must be in [-180, 180].");
        }
    }
    if (reference_week(config.reference_date) == 0) {
        return fail(error, "reference_date must be formatted YYYY-MM-DD.");
    }
    return true;
}

} // namespace birdit
