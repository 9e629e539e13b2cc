#pragma once

#include <system_error>

namespace serial_actor {

    /// @brief Errors reported by the runtime itself
    ///
    /// A task reports its own failures with whatever std::error_code it likes;
    /// these values only describe what the actor did with a submission.
    enum class error : int {
        closed = 1,     ///< actor stopped, nothing can be enqueued
        queue_full,     ///< bounded mailbox had no room
        poisoned,       ///< rejected because an earlier task failed
        shutdown,       ///< discarded by a hard stop before it ran
        timeout,        ///< a submit-and-wait deadline expired
        task_exception, ///< the task threw instead of returning a code
    };

    const std::error_category& error_category() noexcept;

    std::error_code make_error_code(error e) noexcept;

} // namespace serial_actor

namespace std {

    template<>
    struct is_error_code_enum<serial_actor::error> : true_type {};

} // namespace std
