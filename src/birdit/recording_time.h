//
//  recording_time.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace birdit::detail {

/// @brief Recording start encoded in a file name as `YYYYMMDD_HHMMSS`.
struct RecordingTimestamp {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief Parse the recording start from the stem of `source_file`.
 *
 * The stem (file name without its extension) must end in `YYYYMMDD_HHMMSS`,
 * e.g. `AM01_20240512_053000.WAV`.
 */
bool parse_recording_timestamp(const std::string& source_file,
                               RecordingTimestamp* timestamp,
                               std::string* error);

/// @brief `YYYYMMDD_HHMMSS`.
std::string format_compact(const RecordingTimestamp& timestamp);

/// @brief `YYYY-MM-DD HH:MM:SS.mmm` of `timestamp + offset_seconds`, carrying across days.
std::string format_with_offset(const RecordingTimestamp& timestamp, double offset_seconds);

} // namespace birdit::detail
