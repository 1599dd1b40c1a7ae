//
//  birdit_cli.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/batch.h"
#include "birdit/version.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " [options] <audio file>...\n"
        << "\n"
        << "Options:\n"
        << "  --model <path>        TorchScript classifier (default models/perch.pt)\n"
        << "  --labels <path>       Label CSV (default perch_labels.csv)\n"
        << "  --labels-dir <dir>    Search directory for label.csv\n"
        << "  --label-column <name> Label column (default ebird2021)\n"
        << "  --window <seconds>    Window length (default 5.0)\n"
        << "  --overlap <fraction>  Window overlap in [0, 1) (default 0.0)\n"
        << "  --min-conf <value>    Confidence threshold (default 0.1)\n"
        << "  --sample-rate <hz>    Model sample rate (default 32000)\n"
        << "  --batch-size <n>      Windows per forward call (default 1)\n"
        << "  --device <cpu|cuda>   Torch device (default cpu)\n"
        << "  --keep-tail           Pad and keep the final partial window\n"
        << "  --lat <deg>           Recording latitude\n"
        << "  --lon <deg>           Recording longitude\n"
        << "  --date <YYYY-MM-DD>   Reference date for location filtering\n"
        << "  --verbose             Debug logging\n"
        << "  --profile             Timing summary\n"
        << "  --version             Print version\n"
        << "  --help                Show this help\n";
}

bool parse_double(const std::string& text, double* value) {
    try {
        std::size_t used = 0;
        *value = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_size(const std::string& text, std::size_t* value) {
    try {
        std::size_t used = 0;
        const unsigned long long parsed = std::stoull(text, &used);
        *value = static_cast<std::size_t>(parsed);
        return used == text.size() && text.find('-') == std::string::npos;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    birdit::BirditConfig config;
    std::vector<std::string> files;
    bool have_lat = false;
    bool have_lon = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string* value) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            *value = argv[++i];
            return true;
        };
        auto bad_value = [&](const std::string& value) {
            std::cerr << "Invalid value for " << arg << ": " << value << "\n";
            return 1;
        };

        std::string value;
        double number = 0.0;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "birdit " << birdit::version_string() << "\n";
            return 0;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--profile") {
            config.profile = true;
        } else if (arg == "--keep-tail") {
            config.tail_policy = birdit::BirditConfig::TailPolicy::PadAndKeep;
        } else if (arg == "--model") {
            if (!next(&config.model_path)) return 1;
        } else if (arg == "--labels") {
            if (!next(&config.labels_path)) return 1;
        } else if (arg == "--labels-dir") {
            if (!next(&config.labels_search_dir)) return 1;
        } else if (arg == "--label-column") {
            if (!next(&config.label_column)) return 1;
        } else if (arg == "--device") {
            if (!next(&config.torch_device)) return 1;
        } else if (arg == "--date") {
            if (!next(&config.reference_date)) return 1;
        } else if (arg == "--window") {
            if (!next(&value)) return 1;
            if (!parse_double(value, &config.window_seconds)) return bad_value(value);
        } else if (arg == "--overlap") {
            if (!next(&value)) return 1;
            if (!parse_double(value, &config.overlap_fraction)) return bad_value(value);
        } else if (arg == "--min-conf") {
            if (!next(&value)) return 1;
            if (!parse_double(value, &number)) return bad_value(value);
            config.min_confidence = static_cast<float>(number);
        } else if (arg == "--sample-rate") {
            if (!next(&value)) return 1;
            if (!parse_size(value, &config.sample_rate)) return bad_value(value);
        } else if (arg == "--batch-size") {
            if (!next(&value)) return 1;
            if (!parse_size(value, &config.torch_batch_size)) return bad_value(value);
        } else if (arg == "--lat") {
            if (!next(&value)) return 1;
            if (!parse_double(value, &config.latitude)) return bad_value(value);
            have_lat = true;
        } else if (arg == "--lon") {
            if (!next(&value)) return 1;
            if (!parse_double(value, &config.longitude)) return bad_value(value);
            have_lon = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (have_lat != have_lon) {
        std::cerr << "--lat and --lon must be given together.\n";
        return 1;
    }
    config.has_location = have_lat && have_lon;

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const auto result = birdit::analyze_files(files, config, [](std::size_t done, std::size_t total) {
        std::cerr << "\rProcessed " << done << "/" << total << " files" << std::flush;
        if (done == total) {
            std::cerr << "\n";
        }
    });
    if (!result.ok) {
        std::cerr << "birdit: " << birdit::error_kind_name(result.error_kind) << ": "
                  << result.error << "\n";
        return 1;
    }

    std::cout << "source_file\ttimestamp_str\tstart_time\tend_time\tduration\tspecies\tconfidence\n";
    std::cout << std::fixed;
    for (const auto& detection : result.detections) {
        std::cout << detection.source_file << '\t'
                  << detection.timestamp_str << '\t'
                  << std::setprecision(3) << detection.start_time << '\t'
                  << detection.end_time << '\t'
                  << detection.duration << '\t'
                  << detection.species << '\t'
                  << std::setprecision(4) << detection.confidence << '\n';
    }

    for (const auto& failure : result.failures) {
        std::cerr << "failed: " << failure.source_file << " ("
                  << birdit::error_kind_name(failure.kind) << "): " << failure.message << "\n";
    }
    std::cerr << result.detections.size() << " detections, " << result.files_succeeded << "/"
              << result.files_total << " files analyzed.\n";
    return 0;
}
