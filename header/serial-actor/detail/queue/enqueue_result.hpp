#pragma once

#include <cstdint>

namespace serial_actor { namespace detail {

    enum class enqueue_result : uint8_t {
        /// accepted, the consumer already had work queued
        success,
        /// accepted into an empty queue, the consumer was woken
        unblocked_reader,
        queue_closed,
        /// bounded queue had no room and the caller did not want to wait
        queue_full,
        /// bounded queue had no room before the deadline
        timeout
    };

    constexpr bool accepted(enqueue_result result) noexcept {
        return result == enqueue_result::success || result == enqueue_result::unblocked_reader;
    }

}} // namespace serial_actor::detail
