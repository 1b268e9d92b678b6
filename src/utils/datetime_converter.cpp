/**
 * @file datetime_converter.cpp
 * @brief Timestamp conversion implementation
 */

#include "utils/datetime_converter.h"

#include <cstdio>
#include <ctime>

namespace talentvault::utils {

namespace {

constexpr int kEpochYear = 1970;
constexpr int kMillisPerSecond = 1000;
constexpr int64_t kSecondsPerDay = 86400;
constexpr int kIsoMinLength = 20;  // YYYY-MM-DDTHH:MM:SSZ

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 *
 * Avoids timegm(), which is not portable, and mktime(), which depends on the local timezone.
 */
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

}  // namespace

Timestamp NowMillis() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

int64_t ToEpochMillis(Timestamp timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

Timestamp FromEpochMillis(int64_t millis) {
  return Timestamp(std::chrono::milliseconds(millis));
}

std::string FormatIso8601(Timestamp timestamp) {
  int64_t millis = ToEpochMillis(timestamp);
  int64_t seconds = millis / kMillisPerSecond;
  int64_t fraction = millis % kMillisPerSecond;
  if (fraction < 0) {
    fraction += kMillisPerSecond;
    seconds -= 1;
  }

  std::time_t time_value = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_value, &utc);

  char buffer[32];  // NOLINT(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1,
                utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(fraction));
  return buffer;
}

std::optional<Timestamp> ParseIso8601(std::string_view text) {
  if (text.size() < kIsoMinLength || text.back() != 'Z') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  std::string buffer(text);
  int consumed = 0;
  if (std::sscanf(buffer.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                  &consumed) != 6) {
    return std::nullopt;
  }
  // %2d accepts a sign, so the time fields need a lower bound as well
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
      second < 0 || second > 60 || year < kEpochYear) {
    return std::nullopt;
  }

  int millis = 0;
  std::string_view rest = text.substr(static_cast<size_t>(consumed));
  if (!rest.empty() && rest.front() == '.') {
    rest.remove_prefix(1);
    int digits = 0;
    while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (rest.front() - '0');
      }
      ++digits;
      rest.remove_prefix(1);
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }
  if (rest != "Z") {
    return std::nullopt;
  }

  int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  int64_t seconds = days * kSecondsPerDay + hour * 3600 + minute * 60 + second;
  return FromEpochMillis(seconds * kMillisPerSecond + millis);
}

}  // namespace talentvault::utils
