#pragma once

#include <chrono>
#include <string>

namespace localelo::core::util {

// "2026-10-19T13:39:02.417Z"; lexicographic order matches time order.
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point when);
std::string NowUtcTimestamp();

// "20261019_133902" in local time, used in generated file names.
std::string FormatFileStamp(std::chrono::system_clock::time_point when);

}  // namespace localelo::core::util
