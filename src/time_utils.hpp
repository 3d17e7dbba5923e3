#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// ISO-8601 in UTC with millisecond precision, e.g. 2024-05-01T10:00:00.000Z.
std::string format_iso8601(WallTime t);
// Accepts an optional fractional part and an optional "Z" or +hh:mm offset.
// Strings without a zone designator are read as local time.
std::optional<WallTime> parse_iso8601(const std::string& text);

int64_t to_epoch_ms(WallTime t);
WallTime from_epoch_ms(int64_t ms);
int64_t epoch_ms_now();

// Last-write time of a file as wall-clock milliseconds.
std::optional<int64_t> file_mtime_ms(const std::string& path);
