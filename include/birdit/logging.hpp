//
//  logging.hpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace birdit {

struct BirditConfig;

/// @brief Logging level policy for BirdIt.
///
/// Usage contract:
/// - `Error`: a file or the whole batch could not be processed.
/// - `Warn`: degraded behavior such as fallback labels or a file name without
///   a recording timestamp.
/// - `Info`: label source, batch progress and timing summaries.
/// - `Debug`: per-window scores, tensor shapes and backend internals.
///
/// `Warn` and `Error` logs are never gated by local flags; the global logger
/// level alone controls visibility.
enum class LogVerbosity {
    /// @brief Hard failure; requested operation cannot be completed.
    Error = 0,
    /// @brief Recoverable issue, fallback, or suspicious condition.
    Warn = 1,
    /// @brief Operational summary and profiling information.
    Info = 2,
    /// @brief Detailed internal diagnostics and trace data.
    Debug = 3
};

/// @brief Set the current global BirdIt log verbosity.
void set_log_verbosity(LogVerbosity level);

/// @brief Get the current global BirdIt log verbosity.
LogVerbosity get_log_verbosity();

/// @brief Configure BirdIt log verbosity from config flags.
void set_log_verbosity_from_config(const BirditConfig& config);

} // namespace birdit

inline constexpr birdit::LogVerbosity birdit_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return birdit::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return birdit::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return birdit::LogVerbosity::Info;
    }
    return birdit::LogVerbosity::Debug;
}

inline bool birdit_should_log(const char* level) {
    const auto current = birdit::get_log_verbosity();
    const auto severity = birdit_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void birdit_log_impl(const char* level,
                            const std::string& message,
                            const char* file,
                            int line,
                            const char* func) {
    const std::string label = level ? level : "";
    if (label == "error") {
        std::cerr << "[BirdIt][" << label << "][" << file << ":" << line
                  << " " << func << "] " << message << "\n";
        return;
    }

    std::cerr << "[BirdIt][" << label << "] " << message << "\n";
}

inline void birdit_log_multiline_impl(const char* level,
                                      const std::string& message,
                                      const char* file,
                                      int line,
                                      const char* func) {
    if (message.empty()) {
        birdit_log_impl(level, message, file, line, func);
        return;
    }

    std::size_t start = 0;
    while (start <= message.size()) {
        const std::size_t end = message.find('\n', start);
        const std::size_t len =
            (end == std::string::npos) ? (message.size() - start) : (end - start);
        const std::string line_msg = message.substr(start, len);
        if (!line_msg.empty()) {
            birdit_log_impl(level, line_msg, file, line, func);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

namespace birdit {

/// @brief Stream-style logger adapter for building log messages across many statements.
class LogStream {
public:
    LogStream(const char* level, const char* file, int line, const char* func)
        : level_(level),
          file_(file),
          line_(line),
          func_(func),
          enabled_(birdit_should_log(level)) {}

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (enabled_) {
            manip(stream_);
        }
        return *this;
    }

    ~LogStream() {
        if (!enabled_) {
            return;
        }
        birdit_log_multiline_impl(level_, stream_.str(), file_, line_, func_);
    }

private:
    const char* level_ = nullptr;
    const char* file_ = nullptr;
    int line_ = 0;
    const char* func_ = nullptr;
    bool enabled_ = false;
    std::ostringstream stream_;
};

} // namespace birdit

#define BIRDIT_LOG(level, message)                                               \
    do {                                                                         \
        if (birdit_should_log(level)) {                                          \
            std::ostringstream _birdit_log_stream;                               \
            _birdit_log_stream << message;                                       \
            birdit_log_multiline_impl(level,                                     \
                                      _birdit_log_stream.str(),                  \
                                      __FILE__,                                  \
                                      __LINE__,                                  \
                                      __func__);                                 \
        }                                                                        \
    } while (0)

#define BIRDIT_LOG_STREAM(level) ::birdit::LogStream(level, __FILE__, __LINE__, __func__)
#define BIRDIT_LOG_ERROR_STREAM() BIRDIT_LOG_STREAM("error")
#define BIRDIT_LOG_WARN_STREAM() BIRDIT_LOG_STREAM("warn")
#define BIRDIT_LOG_INFO_STREAM() BIRDIT_LOG_STREAM("info")
#define BIRDIT_LOG_DEBUG_STREAM() BIRDIT_LOG_STREAM("debug")

#define BIRDIT_LOG_ERROR(message) BIRDIT_LOG("error", message)
#define BIRDIT_LOG_WARN(message) BIRDIT_LOG("warn", message)
#define BIRDIT_LOG_INFO(message) BIRDIT_LOG("info", message)
#define BIRDIT_LOG_DEBUG(message) BIRDIT_LOG("debug", message)
