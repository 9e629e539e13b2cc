#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

#include <serial-actor/config.hpp>

namespace serial_actor {

    using actor_id = uint64_t;
    using max_throughput_t = std::size_t;

    /// What a send does once the actor is poisoned.
    enum class poison_policy : uint8_t {
        /// keep enqueueing; the loop answers every task with `poisoned`
        reject_on_run,
        /// refuse at the call site with error::poisoned
        reject_on_send
    };

    enum class shutdown_policy : uint8_t {
        /// run everything already queued, then stop
        drain,
        /// answer everything still queued with `shutdown`, then stop
        abort
    };

    constexpr const char* to_string(poison_policy policy) noexcept {
        return policy == poison_policy::reject_on_run ? "reject_on_run" : "reject_on_send";
    }

    constexpr const char* to_string(shutdown_policy policy) noexcept {
        return policy == shutdown_policy::drain ? "drain" : "abort";
    }

    /// Called on the loop thread right after a task poisoned the actor.
    using failure_handler = std::function<void(actor_id, std::error_code)>;

    struct actor_config {
        /// label used in log lines; "actor-<id>" when empty
        std::string name;
        /// mailbox bound, 0 means unbounded
        std::size_t capacity = 0;
        max_throughput_t max_throughput = SERIAL_ACTOR_DEFAULT_MAX_THROUGHPUT;
        poison_policy poison = poison_policy::reject_on_run;
        /// applied when the last handle is released
        shutdown_policy shutdown = shutdown_policy::drain;
        failure_handler on_failure;
    };

} // namespace serial_actor
