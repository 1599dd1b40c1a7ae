//
//  logging.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/logging.hpp"

#include "birdit/config.h"

namespace birdit {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

} // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_verbosity_from_config(const BirditConfig& config) {
    if (config.verbose) {
        set_log_verbosity(LogVerbosity::Debug);
        return;
    }
    if (config.profile) {
        set_log_verbosity(LogVerbosity::Info);
        return;
    }
    set_log_verbosity(LogVerbosity::Warn);
}

} // namespace birdit
