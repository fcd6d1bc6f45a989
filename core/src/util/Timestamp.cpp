#include "localelo/core/util/Timestamp.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace localelo::core::util {

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(when);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &timestamp);
#else
    gmtime_r(&timestamp, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return out.str();
}

std::string NowUtcTimestamp() {
    return FormatUtcTimestamp(std::chrono::system_clock::now());
}

std::string FormatFileStamp(std::chrono::system_clock::time_point when) {
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &timestamp);
#else
    localtime_r(&timestamp, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y%m%d_%H%M%S");
    return out.str();
}

}  // namespace localelo::core::util
