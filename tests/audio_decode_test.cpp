//
//  audio_decode_test.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio/audio_file.h"
#include "audio/dsp.h"

#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace synth = birdit::tests::synthetic_audio;

bool test_mono_pcm16_decodes() {
    const auto dir = synth::make_temp_dir("birdit_wav_mono");
    const auto path = (dir / "mono.wav").string();
    const auto chirp = synth::make_chirp(32000.0, 1.0, 2000.0, 6000.0, 0.5f, 0.0, 1.0);

    synth::write_pcm16_wav(path, chirp, 32000, 1);

    std::vector<float> samples;
    double rate = 0.0;
    std::string error;
    if (!birdit::detail::read_audio_mono(path, &samples, &rate, &error)) {
        std::cerr << "Audio test failed: read: " << error << "\n";
        return false;
    }
    if (rate != 32000.0 || samples.size() != chirp.size()) {
        std::cerr << "Audio test failed: rate or length changed.\n";
        return false;
    }
    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (std::fabs(samples[i] - chirp[i]) > 1e-3f) {
            std::cerr << "Audio test failed: sample " << i << " differs beyond PCM16 precision.\n";
            return false;
        }
    }
    return true;
}

bool test_stereo_is_downmixed() {
    const auto dir = synth::make_temp_dir("birdit_wav_stereo");
    const auto path = dir / "stereo.wav";
    std::vector<float> interleaved;
    for (int i = 0; i < 100; ++i) {
        interleaved.push_back(0.5f);
        interleaved.push_back(-0.25f);
    }
    synth::write_pcm16_wav(path, interleaved, 48000, 2);

    std::vector<float> samples;
    double rate = 0.0;
    std::string error;
    if (!birdit::detail::read_audio_mono(path.string(), &samples, &rate, &error)) {
        std::cerr << "Audio test failed: stereo read: " << error << "\n";
        return false;
    }
    if (samples.size() != 100 || rate != 48000.0) {
        std::cerr << "Audio test failed: stereo frame count or rate wrong.\n";
        return false;
    }
    if (std::fabs(samples[42] - 0.125f) > 1e-3f) {
        std::cerr << "Audio test failed: downmix should average channels, got " << samples[42]
                  << ".\n";
        return false;
    }
    return true;
}

bool test_float_wav_with_extra_chunk() {
    const auto dir = synth::make_temp_dir("birdit_wav_float");
    const auto path = dir / "float.wav";
    const std::vector<float> source{0.0f, 0.25f, -0.75f, 1.0f, -1.0f};
    synth::write_float32_wav_with_list_chunk(path, source, 32000);

    std::vector<float> samples;
    double rate = 0.0;
    std::string error;
    if (!birdit::detail::read_audio_mono(path.string(), &samples, &rate, &error)) {
        std::cerr << "Audio test failed: float read: " << error << "\n";
        return false;
    }
    if (samples != source) {
        std::cerr << "Audio test failed: float samples should be read exactly.\n";
        return false;
    }
    return true;
}

bool test_load_resamples_to_target_rate() {
    const auto dir = synth::make_temp_dir("birdit_wav_resample");
    const auto path = (dir / "low_rate.wav").string();
    const auto chirp = synth::make_chirp(16000.0, 2.0, 1000.0, 3000.0, 0.4f, 0.0, 2.0);
    synth::write_pcm16_wav(path, chirp, 16000, 1);

    std::vector<float> samples;
    std::string error;
    if (!birdit::detail::load_audio_mono(path, 32000, &samples, &error)) {
        std::cerr << "Audio test failed: load: " << error << "\n";
        return false;
    }
    if (samples.size() != 64000) {
        std::cerr << "Audio test failed: expected 64000 samples at 32 kHz, got " << samples.size()
                  << ".\n";
        return false;
    }
    return true;
}

bool test_rejects_unreadable_input() {
    const auto dir = synth::make_temp_dir("birdit_wav_bad");
    const auto garbage = dir / "garbage.wav";
    synth::write_garbage_file(garbage);

    std::vector<float> samples;
    std::string error;
    if (birdit::detail::load_audio_mono(garbage.string(), 32000, &samples, &error) ||
        error.empty()) {
        std::cerr << "Audio test failed: garbage should be rejected with a message.\n";
        return false;
    }
    error.clear();
    if (birdit::detail::load_audio_mono((dir / "missing.wav").string(), 32000, &samples, &error) ||
        error.empty()) {
        std::cerr << "Audio test failed: missing file should be rejected with a message.\n";
        return false;
    }

    const auto empty = dir / "empty.wav";
    synth::write_pcm16_wav(empty, {}, 32000, 1);
    error.clear();
    if (birdit::detail::load_audio_mono(empty.string(), 32000, &samples, &error)) {
        std::cerr << "Audio test failed: a WAV without samples should be rejected.\n";
        return false;
    }
    return true;
}

bool test_unknown_length_header_reads_what_is_there() {
    const auto dir = synth::make_temp_dir("birdit_wav_unknown_length");
    const auto path = dir / "streamed.wav";
    const auto chirp = synth::make_chirp(32000.0, 6.0, 2000.0, 6000.0, 0.5f, 0.0, 6.0);
    synth::write_pcm16_wav(path, chirp, 32000, 1, true);

    std::vector<float> samples;
    double rate = 0.0;
    std::string error;
    if (!birdit::detail::read_audio_mono(path.string(), &samples, &rate, &error)) {
        std::cerr << "Audio test failed: 0xFFFFFFFF data size rejected: " << error << "\n";
        return false;
    }
    if (samples.size() != chirp.size()) {
        std::cerr << "Audio test failed: expected " << chirp.size()
                  << " samples from the file body, got " << samples.size() << ".\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_mono_pcm16_decodes()) {
        return 1;
    }
    if (!test_stereo_is_downmixed()) {
        return 1;
    }
    if (!test_float_wav_with_extra_chunk()) {
        return 1;
    }
    if (!test_load_resamples_to_target_rate()) {
        return 1;
    }
    if (!test_rejects_unreadable_input()) {
        return 1;
    }
    if (!test_unknown_length_header_reads_what_is_there()) {
        return 1;
    }

    std::cout << "Audio decode test passed.\n";
    return 0;
}
