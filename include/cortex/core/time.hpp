#pragma once

/// @file time.hpp
/// @brief Injectable monotonic time source for schedulers

#include "fwd.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace cortex_core {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Milliseconds = std::chrono::milliseconds;

/// Callable returning the current monotonic time
using TimeSource = std::function<TimePoint()>;

/// Real monotonic clock
[[nodiscard]] inline TimeSource steady_time_source() {
    return [] { return SteadyClock::now(); };
}

/// Milliseconds elapsed between two points (fractional)
[[nodiscard]] inline double elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

// =============================================================================
// ManualClock
// =============================================================================

/// Clock that only moves when told to. Copies of source() observe the same
/// underlying time, so the clock may be advanced after handing it out.
class ManualClock {
public:
    ManualClock() : m_now(std::make_shared<TimePoint>(SteadyClock::now())) {}

    [[nodiscard]] TimePoint now() const { return *m_now; }

    void advance(Milliseconds ms) { *m_now += ms; }
    void advance_ms(std::int64_t ms) { *m_now += Milliseconds(ms); }
    void advance_seconds(double seconds) {
        *m_now += std::chrono::duration_cast<SteadyClock::duration>(
            std::chrono::duration<double>(seconds));
    }

    [[nodiscard]] TimeSource source() const {
        auto now = m_now;
        return [now] { return *now; };
    }

private:
    std::shared_ptr<TimePoint> m_now;
};

} // namespace cortex_core
