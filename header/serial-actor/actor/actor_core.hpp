#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <string>
#include <system_error>
#include <thread>

#include <serial-actor/actor/actor_state.hpp>
#include <serial-actor/actor_config.hpp>
#include <serial-actor/config.hpp>
#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/detail/ref_counted.hpp>
#include <serial-actor/detail/reply_state.hpp>
#include <serial-actor/mailbox/mailbox.hpp>
#include <serial-actor/task.hpp>

namespace serial_actor { namespace actor {

    enum class push_mode : uint8_t {
        /// wait for room in a bounded mailbox
        blocking,
        /// give up at once when full
        try_once,
        /// wait for room until the timeout expires
        timed
    };

    enum class resume_result : uint8_t {
        /// throughput exhausted with work left, call resume() again
        resume,
        /// mailbox empty, wait for the next message
        awaiting,
        /// mailbox closed and drained, the loop must exit
        done
    };

    struct resume_info {
        resume_result result;
        std::size_t handled;
    };

    /// @brief Mailbox, poisoning state and the single-consumer loop of one actor
    ///
    /// Shared between the loop thread and the control block. Producers only
    /// call enqueue(); everything else that mutates state runs on the loop
    /// thread, except request_stop().
    class actor_core final : public detail::ref_counted<actor_core> {
    public:
        actor_core(std::pmr::memory_resource* resource, actor_id id, actor_config config);
        ~actor_core();

        std::error_code enqueue(task_t&& body, push_mode mode, std::chrono::nanoseconds timeout = {});

        /// The returned slot is already resolved when the mailbox refused the
        /// task; `refused` then holds the reason.
        intrusive_ptr<detail::reply_state> enqueue_with_reply(task_t&& body, push_mode mode,
                                                              std::chrono::nanoseconds timeout,
                                                              std::error_code& refused);

        resume_info resume(max_throughput_t max_throughput);

        /// Loop body of the dedicated thread; returns once the mailbox is closed and empty.
        void run();

        /// Closes the mailbox. With shutdown_policy::abort the loop discards
        /// whatever it has not started yet.
        void request_stop(shutdown_policy policy);

        bool on_loop_thread() const noexcept;

        actor_state state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        /// Empty while running.
        std::error_code failure() const noexcept;

        lifecycle lifecycle_state() const noexcept {
            return lifecycle_.load(std::memory_order_acquire);
        }

        actor_id id() const noexcept {
            return id_;
        }

        const std::string& name() const noexcept {
            return name_;
        }

        const actor_config& config() const noexcept {
            return config_;
        }

        std::pmr::memory_resource* resource() const noexcept {
            return resource_;
        }

        std::size_t pending() const {
            return mailbox_.size();
        }

        std::size_t processed() const noexcept {
            return processed_.load(std::memory_order_relaxed);
        }

        std::size_t rejected() const noexcept {
            return rejected_.load(std::memory_order_relaxed);
        }

    private:
        std::error_code push(mailbox::message_ptr msg, push_mode mode, std::chrono::nanoseconds timeout);
        void invoke(mailbox::message* msg);
        void poison(mailbox::message_id culprit, std::error_code ec);
        std::size_t discard_remaining();

        std::pmr::memory_resource* resource_;
        const actor_id id_;
        actor_config config_;
        std::string name_;
        mailbox::default_mailbox mailbox_;

        std::atomic<actor_state> state_{actor_state::running};
        std::atomic<lifecycle> lifecycle_{lifecycle::alive};
        std::atomic<bool> abort_requested_{false};
        std::atomic<std::thread::id> loop_thread_{};

        // written once by the loop before state_ turns poisoned
        std::error_code failure_;

        mailbox::message_id last_sequence_ = 0;
        alignas(SERIAL_ACTOR_CACHE_LINE_SIZE) std::atomic<std::size_t> processed_{0};
        std::atomic<std::size_t> rejected_{0};
    };

}} // namespace serial_actor::actor
