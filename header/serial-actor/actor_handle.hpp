#pragma once

#include <cassert>
#include <chrono>
#include <cstddef>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <serial-actor/actor/actor_control.hpp>
#include <serial-actor/actor/actor_state.hpp>
#include <serial-actor/actor_config.hpp>
#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/outcome.hpp>
#include <serial-actor/pending_reply.hpp>
#include <serial-actor/task.hpp>

namespace serial_actor {

    namespace detail {

        /// Wraps a callable into a task_t allocated from `resource`. Callables
        /// returning void always succeed.
        template<class F>
        task_t make_task(std::pmr::memory_resource* resource, F&& f) {
            using functor = std::decay_t<F>;
            if constexpr (std::is_same_v<functor, task_t>) {
                static_assert(!std::is_lvalue_reference_v<F>, "task_t is move-only: pass it with std::move");
                return task_t(resource, std::forward<F>(f));
            } else if constexpr (std::is_void_v<std::invoke_result_t<functor&>>) {
                return task_t(resource, [fn = functor(std::forward<F>(f))]() mutable -> std::error_code {
                    fn();
                    return {};
                });
            } else {
                static_assert(std::is_convertible_v<std::invoke_result_t<functor&>, std::error_code>,
                              "a task must return void or something convertible to std::error_code");
                return task_t(resource, std::forward<F>(f));
            }
        }

    } // namespace detail

    /// @brief Shareable reference to a running actor
    ///
    /// Copies refer to the same actor. The actor stops, with its configured
    /// shutdown policy, when the last copy is destroyed or reset.
    class actor_handle final {
    public:
        actor_handle() noexcept = default;

        explicit actor_handle(intrusive_ptr<actor::actor_control> control) noexcept;

        actor_handle(const actor_handle&) = default;
        actor_handle& operator=(const actor_handle&) = default;
        actor_handle(actor_handle&&) noexcept = default;
        actor_handle& operator=(actor_handle&&) noexcept = default;
        ~actor_handle() = default;

        /// Fire-and-forget. Blocks only while a bounded mailbox is full.
        /// The result says whether the task was queued, never how it ran.
        /// From a task of the same actor it never blocks and returns
        /// error::queue_full instead.
        template<class F>
        std::error_code send(F&& f) {
            return core().enqueue(make(std::forward<F>(f)), actor::push_mode::blocking);
        }

        /// Never blocks; error::queue_full when a bounded mailbox is full.
        template<class F>
        std::error_code try_send(F&& f) {
            return core().enqueue(make(std::forward<F>(f)), actor::push_mode::try_once);
        }

        /// error::queue_full when no room appeared within `timeout`.
        template<class F, class Rep, class Period>
        std::error_code send_for(F&& f, const std::chrono::duration<Rep, Period>& timeout) {
            return core().enqueue(make(std::forward<F>(f)), actor::push_mode::timed,
                                  std::chrono::duration_cast<std::chrono::nanoseconds>(timeout));
        }

        /// A refused task (closed, full while called from the actor's own
        /// loop, or poisoned under reject_on_send) yields a reply that is
        /// already resolved.
        template<class F>
        [[nodiscard]] pending_reply submit(F&& f) {
            std::error_code refused;
            return pending_reply(core().enqueue_with_reply(make(std::forward<F>(f)), actor::push_mode::blocking, {}, refused));
        }

        /// Must not be called from a task of the same actor.
        template<class F>
        outcome send_and_wait(F&& f) {
            assert(!core().on_loop_thread() && "send_and_wait() from inside the actor would deadlock");
            return submit(std::forward<F>(f)).get();
        }

        /// One deadline covers both the wait for mailbox room and the wait
        /// for the outcome.
        template<class F, class Rep, class Period>
        outcome send_and_wait_for(F&& f, const std::chrono::duration<Rep, Period>& timeout) {
            assert(!core().on_loop_thread() && "send_and_wait_for() from inside the actor would deadlock");
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            std::error_code refused;
            auto state = core().enqueue_with_reply(make(std::forward<F>(f)), actor::push_mode::timed,
                                                   std::chrono::duration_cast<std::chrono::nanoseconds>(timeout),
                                                   refused);
            if (refused == error::queue_full) {
                return outcome::from_error(error::timeout);
            }
            return await_until(pending_reply(std::move(state)), deadline);
        }

        /// Closes the mailbox and waits for the loop to exit. From inside a
        /// task it only requests the stop.
        void stop(shutdown_policy policy = shutdown_policy::drain);

        actor_state state() const noexcept;
        bool poisoned() const noexcept;
        std::error_code failure() const noexcept;
        lifecycle lifecycle_state() const noexcept;
        actor_id id() const noexcept;
        const std::string& name() const noexcept;
        std::size_t pending() const;
        std::size_t processed() const noexcept;
        std::size_t rejected() const noexcept;

        bool valid() const noexcept {
            return static_cast<bool>(control_);
        }

        explicit operator bool() const noexcept {
            return valid();
        }

        void reset() noexcept {
            control_.reset();
        }

        std::size_t use_count() const noexcept;

        friend bool operator==(const actor_handle& lhs, const actor_handle& rhs) noexcept {
            return lhs.control_ == rhs.control_;
        }

    private:
        actor::actor_core& core() const noexcept {
            assert(control_ && "use of an empty actor_handle");
            return control_->core();
        }

        template<class F>
        task_t make(F&& f) const {
            return detail::make_task(core().resource(), std::forward<F>(f));
        }

        static outcome await_until(pending_reply reply, std::chrono::steady_clock::time_point deadline);

        intrusive_ptr<actor::actor_control> control_;
    };

} // namespace serial_actor
