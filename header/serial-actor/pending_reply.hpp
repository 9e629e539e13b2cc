#pragma once

#include <cassert>
#include <chrono>

#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/detail/reply_state.hpp>
#include <serial-actor/outcome.hpp>

namespace serial_actor {

    /// @brief Caller side of one submit-and-wait request
    ///
    /// Move-only. The outcome is written exactly once by the actor (or by the
    /// submission path when the mailbox refused the task) and read at most
    /// once through get(). Dropping an unread reply discards it; the task
    /// still runs.
    class pending_reply final {
    public:
        pending_reply() noexcept = default;

        explicit pending_reply(intrusive_ptr<detail::reply_state> state) noexcept;

        pending_reply(const pending_reply&) = delete;
        pending_reply& operator=(const pending_reply&) = delete;

        pending_reply(pending_reply&& other) noexcept;
        pending_reply& operator=(pending_reply&& other) noexcept;

        ~pending_reply() noexcept;

        [[nodiscard]] bool valid() const noexcept {
            return state_ != nullptr;
        }

        [[nodiscard]] bool is_ready() const noexcept {
            return state_ && state_->is_ready();
        }

        /// Blocks until the outcome is written.
        void wait() const;

        /// @return false when the outcome was still missing after `timeout`
        template<class Rep, class Period>
        bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
            assert(state_ && "wait_for() on invalid reply");
            return state_->wait_until(std::chrono::steady_clock::now() + timeout);
        }

        [[nodiscard]] outcome get() &&;
        outcome get() & = delete;

        /// Like get(), but gives up after `timeout` with an outcome of kind
        /// `timeout`. The reply is invalid afterwards either way.
        template<class Rep, class Period>
        [[nodiscard]] outcome get_for(const std::chrono::duration<Rep, Period>& timeout) && {
            assert(state_ && "get_for() on invalid reply");
            if (!wait_for(timeout)) {
                if (state_->cancel()) {
                    state_ = nullptr;
                    return outcome::from_error(error::timeout);
                }
                // lost the race against the writer, the value is on its way
                state_->wait();
            }
            return std::move(*this).get();
        }

        /// Stops listening. The task is not retracted.
        void cancel() noexcept;

    private:
        intrusive_ptr<detail::reply_state> state_;
    };

} // namespace serial_actor
