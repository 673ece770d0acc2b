#include "brightchain/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace brightchain {
namespace time {

uint64_t timestamp_milliseconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<Milliseconds>(Clock::now().time_since_epoch()).count());
}

TimePoint from_timestamp_milliseconds(uint64_t timestamp_ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(Milliseconds(timestamp_ms)));
}

std::string to_string(const TimePoint& tp) {
    const auto ms = std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t seconds = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // namespace time
} // namespace brightchain
