#pragma once

#include <cstdint>

namespace serial_actor {

    /// running -> poisoned, never back.
    enum class actor_state : uint8_t {
        running = 0,
        poisoned = 1
    };

    /// State of the execution loop, independent of task outcomes.
    enum class lifecycle : uint8_t {
        alive = 0,
        stopping = 1,
        stopped = 2
    };

    constexpr const char* to_string(actor_state s) noexcept {
        return s == actor_state::running ? "running" : "poisoned";
    }

    constexpr const char* to_string(lifecycle l) noexcept {
        switch (l) {
            case lifecycle::alive:
                return "alive";
            case lifecycle::stopping:
                return "stopping";
            case lifecycle::stopped:
                return "stopped";
        }
        return "unknown";
    }

} // namespace serial_actor
