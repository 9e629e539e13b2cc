#pragma once

#include <algorithm>
#include <chrono>
#include <thread>

namespace serial_actor { namespace detail {

    constexpr int kSpinPhaseEnd = 4;
    constexpr int kYieldPhaseEnd = 10;
    constexpr int kMaxSleepMicroseconds = 1000;
    constexpr int kMaxBackoffAttempt = kYieldPhaseEnd + 10;

    /// Spin, then yield, then sleep with a doubling interval capped at 1ms.
    /// Advances `attempt`, which saturates at kMaxBackoffAttempt.
    inline void exponential_backoff(int& attempt) noexcept {
        if (attempt < kSpinPhaseEnd) {
        } else if (attempt < kYieldPhaseEnd) {
            std::this_thread::yield();
        } else {
            auto sleep_us = std::min(1 << std::min(attempt - kYieldPhaseEnd, 10), kMaxSleepMicroseconds);
            std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
        }
        if (attempt < kMaxBackoffAttempt) {
            ++attempt;
        }
    }

}} // namespace serial_actor::detail
