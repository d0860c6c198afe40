#include "time.hpp"

#include <sys/stat.h>

#include <cstdio>
#include <ctime>

namespace framecache::util {

TimePoint Now() {
  return Clock::now();
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::optional<double> ModifiedSeconds(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
}

std::optional<double> ParseExifDateTime(const std::string& value) {
  int  year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  char tail = 0;
  const int matched = std::sscanf(value.c_str(), "%4d:%2d:%2d %2d:%2d:%2d%c", &year, &month, &day, &hour, &minute, &second, &tail);
  if (matched != 6) {
    return std::nullopt;
  }
  if (year < 1900 || month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 ||
      minute > 59 || second < 0 || second > 59) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year  = year - 1900;
  tm.tm_mon   = month - 1;
  tm.tm_mday  = day;
  tm.tm_hour  = hour;
  tm.tm_min   = minute;
  tm.tm_sec   = second;
  tm.tm_isdst = -1;

  const std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  // mktime normalizes out-of-range days (2019:02:31 -> March 3); the hour may
  // still move across a DST gap
  if (tm.tm_year != year - 1900 || tm.tm_mon != month - 1 || tm.tm_mday != day) {
    return std::nullopt;
  }
  return static_cast<double>(t);
}

} // namespace framecache::util
