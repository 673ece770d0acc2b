#pragma once

#include "brightchain/common.hpp"
#include <chrono>

namespace brightchain {
namespace time {

using Clock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Unix timestamp in milliseconds, the unit CBL headers carry
uint64_t timestamp_milliseconds();

// Convert a CBL timestamp back to a TimePoint
TimePoint from_timestamp_milliseconds(uint64_t timestamp_ms);

// ISO 8601 (UTC, millisecond precision)
std::string to_string(const TimePoint& tp);

// Elapsed time of an encode or decode run
class Timer {
public:
    Timer() : start_(SteadyClock::now()) {}

    void reset() { start_ = SteadyClock::now(); }

    double elapsed_seconds() const {
        return std::chrono::duration<double>(SteadyClock::now() - start_).count();
    }

    uint64_t elapsed_milliseconds() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<Milliseconds>(SteadyClock::now() - start_).count());
    }

private:
    SteadyClock::time_point start_;
};

} // namespace time
} // namespace brightchain
