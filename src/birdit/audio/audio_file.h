//
//  audio_file.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace birdit::detail {

/**
 * @brief Decode any format libsndfile reads (WAV, FLAC, OGG, AIFF, ...) to mono float.
 *
 * Multi-channel frames are averaged. Frames are pulled in fixed chunks, so a
 * header that overstates its data size never drives the allocation.
 */
bool read_audio_mono(const std::string& path,
                     std::vector<float>* samples,
                     double* sample_rate,
                     std::string* error);

} // namespace birdit::detail
