//
//  audio_file.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio_file.h"

#include <cstring>
#include <memory>

#include <sndfile.h>

namespace birdit::detail {

bool read_audio_mono(const std::string& path,
                     std::vector<float>* samples,
                     double* sample_rate,
                     std::string* error) {
    if (!samples) {
        if (error) {
            *error = "Output pointer is null.";
        }
        return false;
    }
    samples->clear();

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    SNDFILE* raw = sf_open(path.c_str(), SFM_READ, &info);
    if (!raw) {
        if (error) {
            *error = "Cannot open audio file " + path + ": " + sf_strerror(nullptr);
        }
        return false;
    }
    std::unique_ptr<SNDFILE, decltype(&sf_close)> file(raw, &sf_close);

    if (info.channels <= 0 || info.samplerate <= 0) {
        if (error) {
            *error = "Audio file " + path + " reports no channels or sample rate.";
        }
        return false;
    }

    const std::size_t channels = static_cast<std::size_t>(info.channels);
    constexpr sf_count_t kChunkFrames = 4096;
    std::vector<float> chunk(static_cast<std::size_t>(kChunkFrames) * channels);
    if (info.frames > 0 && info.frames < (sf_count_t{1} << 31)) {
        samples->reserve(static_cast<std::size_t>(info.frames));
    }

    while (true) {
        const sf_count_t frames = sf_readf_float(file.get(), chunk.data(), kChunkFrames);
        if (frames <= 0) {
            break;
        }
        for (sf_count_t f = 0; f < frames; ++f) {
            const float* frame = chunk.data() + static_cast<std::size_t>(f) * channels;
            float sum = 0.0f;
            for (std::size_t c = 0; c < channels; ++c) {
                sum += frame[c];
            }
            samples->push_back(sum / static_cast<float>(channels));
        }
    }

    if (sf_error(file.get()) != SF_ERR_NO_ERROR) {
        if (error) {
            *error = "Error decoding " + path + ": " + sf_strerror(file.get());
        }
        samples->clear();
        return false;
    }

    if (sample_rate) {
        *sample_rate = static_cast<double>(info.samplerate);
    }
    return true;
}

} // namespace birdit::detail
