/**
 * @file time_utils.cpp
 * @brief RFC 3339 timestamp formatting and parsing
 */

#include "utils/time_utils.h"

#include <cstdio>
#include <ctime>

namespace memex::utils {

namespace {

constexpr int64_t kNanosPerSecond = 1000000000;
constexpr int kFractionDigits = 9;

bool ParseDigits(std::string_view text, size_t pos, size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    value = value * 10 + (text[i] - '0');  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  }
  out = value;
  return true;
}

}  // namespace

std::string FormatTimestamp(Timestamp timestamp) {
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp.time_since_epoch()).count();
  int64_t seconds = nanos / kNanosPerSecond;
  int64_t fraction = nanos % kNanosPerSecond;
  if (fraction < 0) {
    fraction += kNanosPerSecond;
    seconds -= 1;
  }

  std::time_t time_seconds = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_seconds, &utc);

  char date_buf[32];
  std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%dT%H:%M:%S", &utc);
  char frac_buf[16];
  std::snprintf(frac_buf, sizeof(frac_buf), ".%09lld", static_cast<long long>(fraction));  // NOLINT(google-runtime-int)
  return std::string(date_buf) + frac_buf + "Z";
}

std::optional<Timestamp> ParseTimestamp(std::string_view text) {
  // YYYY-MM-DDTHH:MM:SS
  constexpr size_t kBaseLength = 19;
  if (text.size() < kBaseLength + 1) {
    return std::nullopt;
  }

  std::tm utc{};
  int year = 0;
  int month = 0;
  if (!ParseDigits(text, 0, 4, year) || text[4] != '-' || !ParseDigits(text, 5, 2, month) || text[7] != '-' ||
      !ParseDigits(text, 8, 2, utc.tm_mday) || (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
      !ParseDigits(text, 11, 2, utc.tm_hour) || text[13] != ':' || !ParseDigits(text, 14, 2, utc.tm_min) ||
      text[16] != ':' || !ParseDigits(text, 17, 2, utc.tm_sec)) {
    return std::nullopt;
  }
  utc.tm_year = year - 1900;  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  utc.tm_mon = month - 1;

  size_t pos = kBaseLength;
  int64_t fraction = 0;
  if (text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < kFractionDigits) {
        fraction = fraction * 10 + (text[pos] - '0');  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < kFractionDigits; ++digits) {
      fraction *= 10;  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
    }
  }

  int64_t offset_seconds = 0;
  if (pos >= text.size()) {
    return std::nullopt;
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    int hours = 0;
    int minutes = 0;
    if (!ParseDigits(text, pos + 1, 2, hours) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
        !ParseDigits(text, pos + 4, 2, minutes)) {
      return std::nullopt;
    }
    offset_seconds = (static_cast<int64_t>(hours) * 3600 + minutes * 60) * (text[pos] == '-' ? -1 : 1);  // NOLINT
    pos += 6;  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
  } else {
    return std::nullopt;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  int64_t seconds = static_cast<int64_t>(timegm(&utc)) - offset_seconds;
  auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(fraction);
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

int64_t ToUnixSeconds(Timestamp timestamp) {
  return std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
}

}  // namespace memex::utils
