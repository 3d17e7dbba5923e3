#include "time_utils.hpp"

#include <sys/stat.h>

#include <cstdio>
#include <ctime>

#include <spdlog/fmt/fmt.h>

std::string format_iso8601(WallTime t) {
  auto ms = to_epoch_ms(t);
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if(millis < 0) {
    millis += 1000;
    secs -= 1;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                     tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::optional<WallTime> parse_iso8601(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;
  if(std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                 &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
    return std::nullopt;
  }
  if(month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }
  std::size_t pos = static_cast<std::size_t>(consumed);
  int64_t micros = 0;
  if(pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while(pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if(digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    while(digits < 6) {
      micros *= 10;
      ++digits;
    }
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  std::time_t secs = 0;
  if(pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    secs = timegm(&tm);
  } else if(pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int off_h = 0, off_m = 0;
    if(std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) < 1) {
      return std::nullopt;
    }
    int sign = text[pos] == '+' ? 1 : -1;
    secs = timegm(&tm) - sign * (off_h * 3600 + off_m * 60);
  } else if(pos == text.size()) {
    tm.tm_isdst = -1;
    secs = std::mktime(&tm);
  } else {
    return std::nullopt;
  }
  return WallClock::from_time_t(secs) +
         std::chrono::duration_cast<WallClock::duration>(std::chrono::microseconds(micros));
}

int64_t to_epoch_ms(WallTime t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

WallTime from_epoch_ms(int64_t ms) {
  return WallTime(std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(ms)));
}

int64_t epoch_ms_now() {
  return to_epoch_ms(WallClock::now());
}

std::optional<int64_t> file_mtime_ms(const std::string& path) {
  struct stat st{};
  if(::stat(path.c_str(), &st) != 0) return std::nullopt;
  return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
}
