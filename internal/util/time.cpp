#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace flowstore::util {

namespace {

constexpr std::size_t kInstallVersionLength = 23; // yyyy-MM-dd-HH:mm.ss.SSS

bool IsDigits(const std::string& s, std::size_t pos, std::size_t count) {
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

int ToInt(const std::string& s, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) value = value * 10 + (s[i] - '0');
  return value;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatInstallVersion(TimePoint tp) {
  const auto millis = ToUnixMillis(tp);
  const auto secs   = static_cast<std::time_t>(millis / 1000);

  std::tm utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d-%02d:%02d.%02d.%03d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis % 1000));
  return buf;
}

std::optional<TimePoint> ParseInstallVersion(const std::string& name) {
  if (name.size() != kInstallVersionLength) return std::nullopt;
  if (name[4] != '-' || name[7] != '-' || name[10] != '-' || name[13] != ':' || name[16] != '.' || name[19] != '.') return std::nullopt;
  if (!IsDigits(name, 0, 4) || !IsDigits(name, 5, 2) || !IsDigits(name, 8, 2) || !IsDigits(name, 11, 2) || !IsDigits(name, 14, 2) ||
      !IsDigits(name, 17, 2) || !IsDigits(name, 20, 3)) {
    return std::nullopt;
  }

  const int month  = ToInt(name, 5, 2);
  const int day    = ToInt(name, 8, 2);
  const int hour   = ToInt(name, 11, 2);
  const int minute = ToInt(name, 14, 2);
  const int second = ToInt(name, 17, 2);
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) return std::nullopt;

  const int64_t days  = DaysFromCivil(ToInt(name, 0, 4), static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t total = ((days * 24 + hour) * 60 + minute) * 60 + second;
  return TimePoint{} + std::chrono::seconds(total) + std::chrono::milliseconds(ToInt(name, 20, 3));
}

} // namespace flowstore::util
