#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include <serial-actor/config.hpp>
#include <serial-actor/detail/queue/enqueue_result.hpp>
#include <serial-actor/detail/queue/linked_list.hpp>
#include <serial-actor/mailbox/message.hpp>

namespace serial_actor { namespace mailbox {

    using message_list = serial_actor::detail::linked_list<message, message_deleter>;

    /// @brief Multi-producer / single-consumer FIFO guarded by one mutex
    ///
    /// capacity == 0 means unbounded. A refused message is answered with the
    /// matching error before it is destroyed.
    class default_mailbox_impl {
    public:
        explicit default_mailbox_impl(std::size_t capacity = 0);
        ~default_mailbox_impl();
        default_mailbox_impl(const default_mailbox_impl&) = delete;
        default_mailbox_impl& operator=(const default_mailbox_impl&) = delete;

        serial_actor::detail::enqueue_result push_back_impl(message_ptr);
        serial_actor::detail::enqueue_result try_push_back_impl(message_ptr);
        serial_actor::detail::enqueue_result push_back_for_impl(message_ptr, std::chrono::nanoseconds);
        message_ptr pop_front_impl();
        void wait_impl();
        bool closed_impl() const noexcept;
        std::size_t close_impl();
        std::size_t size_impl() const;
        std::size_t capacity_impl() const noexcept;
        message_list drain_impl();

    private:
        bool full() const noexcept;
        serial_actor::detail::enqueue_result accept(std::unique_lock<std::mutex>& guard, message_ptr ptr);
        static serial_actor::detail::enqueue_result refuse(message_ptr ptr, serial_actor::detail::enqueue_result why) noexcept;

        const std::size_t capacity_;
        mutable std::mutex lock_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        message_list queue_;
        message_id accepted_ = 0;
        std::atomic<bool> closed_{false};
    };

    template<class T>
    class mailbox_t final : protected T {
    public:
        explicit mailbox_t(std::size_t capacity = 0)
            : T(capacity) {}

        ~mailbox_t() = default;

        /// Blocks while a bounded mailbox is full.
        serial_actor::detail::enqueue_result push_back(message_ptr ptr) {
            return self()->push_back_impl(std::move(ptr));
        }
        serial_actor::detail::enqueue_result try_push_back(message_ptr ptr) {
            return self()->try_push_back_impl(std::move(ptr));
        }
        template<class Rep, class Period>
        serial_actor::detail::enqueue_result push_back_for(message_ptr ptr, const std::chrono::duration<Rep, Period>& timeout) {
            return self()->push_back_for_impl(std::move(ptr), std::chrono::duration_cast<std::chrono::nanoseconds>(timeout));
        }
        message_ptr pop_front() {
            return self()->pop_front_impl();
        }
        /// Consumer side: blocks until a message is queued or the mailbox is closed.
        void wait() {
            self()->wait_impl();
        }
        bool closed() const noexcept {
            return self()->closed_impl();
        }
        std::size_t close() {
            return self()->close_impl();
        }
        std::size_t size() const {
            return self()->size_impl();
        }
        std::size_t capacity() const noexcept {
            return self()->capacity_impl();
        }
        bool empty() const {
            return size() == 0;
        }
        message_list drain() {
            return self()->drain_impl();
        }

    private:
        auto self() noexcept -> T* {
            return static_cast<T*>(this);
        }

        auto self() const noexcept -> const T* {
            return static_cast<const T*>(this);
        }
    };

    using default_mailbox = mailbox_t<default_mailbox_impl>;

}} // namespace serial_actor::mailbox
