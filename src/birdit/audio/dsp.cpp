//
//  dsp.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "dsp.h"

#include "audio_file.h"

#include "birdit/logging.hpp"

#include <cmath>

namespace birdit::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate) {
  if (input_rate <= 0.0 || target_rate == 0 || input.empty()) {
    return {};
  }
  if (static_cast<std::size_t>(std::lround(input_rate)) == target_rate) {
    return input;
  }

  const double ratio = static_cast<double>(target_rate) / input_rate;
  const std::size_t output_size =
      static_cast<std::size_t>(std::lround(input.size() * ratio));
  std::vector<float> output(output_size, 0.0f);

  for (std::size_t i = 0; i < output_size; ++i) {
    const double position = static_cast<double>(i) / ratio;
    const std::size_t index = static_cast<std::size_t>(position);
    const double frac = position - static_cast<double>(index);
    if (index + 1 < input.size()) {
      const float a = input[index];
      const float b = input[index + 1];
      output[i] = static_cast<float>((1.0 - frac) * a + frac * b);
    } else if (index < input.size()) {
      output[i] = input[index];
    }
  }

  return output;
}

bool load_audio_mono(const std::string &path,
                     std::size_t target_rate,
                     std::vector<float> *samples,
                     std::string *error) {
  if (!samples) {
    return false;
  }
  samples->clear();

  std::vector<float> decoded;
  double source_rate = 0.0;
  if (!read_audio_mono(path, &decoded, &source_rate, error)) {
    return false;
  }
  if (decoded.empty()) {
    if (error) {
      *error = "Decoded audio is empty.";
    }
    return false;
  }

  if (static_cast<std::size_t>(std::lround(source_rate)) != target_rate) {
    BIRDIT_LOG_DEBUG("Audio: resampling " << path << " from " << source_rate
                                          << " Hz to " << target_rate << " Hz.");
  }
  *samples = resample_linear_mono(decoded, source_rate, target_rate);
  if (samples->empty()) {
    if (error) {
      *error = "Resampling produced no samples.";
    }
    return false;
  }
  return true;
}

} // namespace birdit::detail
