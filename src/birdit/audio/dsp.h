//
//  dsp.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace birdit::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate);

/**
 * @brief Decode `path` to mono at `target_rate`.
 *
 * @return `false` with `error` set when the file cannot be decoded or holds no samples.
 */
bool load_audio_mono(const std::string &path,
                     std::size_t target_rate,
                     std::vector<float> *samples,
                     std::string *error);

} // namespace birdit::detail
