#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace framecache::util {

/*
  Time utilities: clock source and EXIF timestamp parsing.

  Stored timestamps are seconds since the Unix epoch as double,
  keeping the sub-second part of filesystem mtimes.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

double ToUnixSeconds(TimePoint tp);

// Modification time of a file or directory; nullopt if it cannot be stat'ed.
std::optional<double> ModifiedSeconds(const std::filesystem::path& path);

// Parses an EXIF "YYYY:MM:DD HH:MM:SS" timestamp as local time.
std::optional<double> ParseExifDateTime(const std::string& value);

} // namespace framecache::util
