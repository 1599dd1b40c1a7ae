//
//  batch.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/batch.h"

#include "birdit/logging.hpp"
#include "birdit/window.h"

#include "audio/dsp.h"
#include "recording_time.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>
#include <utility>

namespace birdit {
namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

void enrich_detections(const std::string& source_file, std::vector<Detection>* detections) {
    detail::RecordingTimestamp timestamp;
    std::string error;
    if (!detail::parse_recording_timestamp(source_file, &timestamp, &error)) {
        BIRDIT_LOG_WARN("No recording timestamp for " << source_file << ": " << error << ".");
        return;
    }

    const std::string compact = detail::format_compact(timestamp);
    for (auto& detection : *detections) {
        detection.timestamp_str = compact;
        detection.absolute_start = detail::format_with_offset(timestamp, detection.start_time);
        detection.has_timestamp = true;
    }
}

BatchResult fail_fast(ErrorKind kind, const std::string& message, std::size_t files_total) {
    BatchResult result;
    result.ok = false;
    result.error_kind = kind;
    result.error = message;
    result.files_total = files_total;
    BIRDIT_LOG_ERROR(error_kind_name(kind) << ": " << message);
    return result;
}

} // namespace

BatchAnalyzer::BatchAnalyzer(BirditConfig config,
                             LabelCatalog labels,
                             std::shared_ptr<InferenceBackend> backend)
    : config_(std::move(config)),
      labels_(std::move(labels)),
      backend_(std::move(backend)) {}

bool BatchAnalyzer::analyze_samples(const std::vector<float>& samples,
                                    const std::string& source_file,
                                    std::vector<Detection>* out_detections,
                                    ErrorKind* error_kind,
                                    std::string* error,
                                    PipelineTiming* timing) {
    if (!out_detections) {
        return false;
    }
    out_detections->clear();

    auto set_failure = [&](ErrorKind kind, const std::string& message) {
        if (error_kind) {
            *error_kind = kind;
        }
        if (error) {
            *error = message;
        }
        return false;
    };

    if (!backend_) {
        return set_failure(ErrorKind::ModelUnavailable, "No inference backend.");
    }

    std::vector<AudioWindow> windows;
    std::string segment_error;
    if (!segment_signal(samples,
                        static_cast<double>(config_.sample_rate),
                        config_.window_seconds,
                        config_.overlap_fraction,
                        config_.tail_policy,
                        &windows,
                        &segment_error)) {
        return set_failure(ErrorKind::InvalidConfiguration, segment_error);
    }
    if (windows.empty()) {
        return true;
    }

    const std::size_t batch_size = std::max<std::size_t>(1, backend_->max_batch_size(config_));
    std::vector<std::vector<float>> scores;
    scores.reserve(windows.size());

    InferenceTiming inference_timing;
    const auto inference_start = Clock::now();
    for (std::size_t begin = 0; begin < windows.size(); begin += batch_size) {
        const std::size_t end = std::min(windows.size(), begin + batch_size);
        std::vector<std::vector<float>> chunk;
        chunk.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            chunk.push_back(windows[i].samples);
        }

        std::vector<std::vector<float>> chunk_scores;
        if (!backend_->infer_windows(chunk, config_, &chunk_scores, &inference_timing)) {
            std::ostringstream message;
            message << "Inference failed at " << windows[begin].start_seconds << " s.";
            return set_failure(ErrorKind::InferenceFailed, message.str());
        }
        if (chunk_scores.size() != chunk.size()) {
            std::ostringstream message;
            message << "Backend returned " << chunk_scores.size() << " score vectors for "
                    << chunk.size() << " windows.";
            return set_failure(ErrorKind::InferenceFailed, message.str());
        }
        for (auto& window_scores : chunk_scores) {
            scores.push_back(std::move(window_scores));
        }
    }
    if (timing) {
        timing->inference_ms += elapsed_ms(inference_start);
        timing->windows += windows.size();
    }

    std::string decode_error;
    if (!decode_detections(scores,
                           windows,
                           labels_,
                           config_.min_confidence,
                           out_detections,
                           &decode_error)) {
        return set_failure(ErrorKind::InferenceFailed, decode_error);
    }
    for (auto& detection : *out_detections) {
        detection.source_file = source_file;
    }

    BIRDIT_LOG_DEBUG("Analyzed " << source_file << ": " << windows.size() << " windows, "
                     << out_detections->size() << " detections, "
                     << inference_timing.forward_calls << " forward calls.");
    return true;
}

bool BatchAnalyzer::analyze_file(const std::string& path,
                                 std::vector<Detection>* out_detections,
                                 FileFailure* failure,
                                 PipelineTiming* timing) {
    if (!out_detections) {
        return false;
    }
    out_detections->clear();

    auto report = [&](ErrorKind kind, const std::string& message) {
        if (failure) {
            failure->source_file = path;
            failure->kind = kind;
            failure->message = message;
        }
        BIRDIT_LOG_ERROR("Error analyzing " << path << " (" << error_kind_name(kind)
                         << "): " << message);
        return false;
    };

    std::vector<float> samples;
    std::string error;
    const auto decode_start = Clock::now();
    try {
        if (!detail::load_audio_mono(path, config_.sample_rate, &samples, &error)) {
            return report(ErrorKind::AudioDecodeFailed, error);
        }
    } catch (const std::exception& ex) {
        return report(ErrorKind::AudioDecodeFailed, std::string("decode exception: ") + ex.what());
    }
    if (timing) {
        timing->decode_ms += elapsed_ms(decode_start);
    }

    ErrorKind kind = ErrorKind::None;
    std::vector<Detection> detections;
    try {
        if (!analyze_samples(samples, path, &detections, &kind, &error, timing)) {
            return report(kind, error);
        }
    } catch (const std::exception& ex) {
        return report(ErrorKind::InferenceFailed, std::string("analysis exception: ") + ex.what());
    }

    enrich_detections(path, &detections);
    *out_detections = std::move(detections);
    return true;
}

BatchResult BatchAnalyzer::run(const std::vector<std::string>& files,
                               const ProgressCallback& progress) {
    std::string config_error;
    if (!validate_config(config_, &config_error)) {
        return fail_fast(ErrorKind::InvalidConfiguration, config_error, files.size());
    }
    if (!backend_) {
        return fail_fast(ErrorKind::ModelUnavailable, "No inference backend.", files.size());
    }

    BatchResult result;
    result.ok = true;
    result.files_total = files.size();

    const auto total_start = Clock::now();
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::vector<Detection> detections;
        FileFailure failure;
        if (analyze_file(files[i], &detections, &failure, &result.timing)) {
            result.files_succeeded += 1;
            result.detections.insert(result.detections.end(),
                                     std::make_move_iterator(detections.begin()),
                                     std::make_move_iterator(detections.end()));
        } else {
            result.failures.push_back(std::move(failure));
        }

        BIRDIT_LOG_INFO("[" << (i + 1) << "/" << files.size() << "] " << files[i]);
        if (progress) {
            progress(i + 1, files.size());
        }
    }
    result.timing.total_ms = elapsed_ms(total_start);

    if (config_.profile) {
        BIRDIT_LOG_INFO("Timing: decode=" << result.timing.decode_ms
                        << "ms inference=" << result.timing.inference_ms
                        << "ms total=" << result.timing.total_ms
                        << "ms windows=" << result.timing.windows);
    }
    if (!result.failures.empty()) {
        auto log = BIRDIT_LOG_WARN_STREAM();
        log << result.failures.size() << " of " << files.size() << " files failed:";
        for (const auto& failure : result.failures) {
            log << "\n  " << failure.source_file << " (" << error_kind_name(failure.kind) << ")";
        }
    }
    BIRDIT_LOG_INFO("Batch done: " << result.detections.size() << " detections from "
                    << result.files_succeeded << "/" << result.files_total << " files.");
    return result;
}

BatchResult analyze_files(const std::vector<std::string>& files,
                          const BirditConfig& config,
                          const ProgressCallback& progress) {
    set_log_verbosity_from_config(config);

    std::string error;
    if (!validate_config(config, &error)) {
        return fail_fast(ErrorKind::InvalidConfiguration, error, files.size());
    }

    std::shared_ptr<InferenceBackend> backend = make_torch_inference_backend(config, &error);
    if (!backend) {
        return fail_fast(ErrorKind::ModelUnavailable, error, files.size());
    }

    BatchAnalyzer analyzer(config, load_label_catalog(config, backend->class_count()), backend);
    return analyzer.run(files, progress);
}

} // namespace birdit
