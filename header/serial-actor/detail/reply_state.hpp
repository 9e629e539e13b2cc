#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory_resource>

#include <serial-actor/config.hpp>
#include <serial-actor/detail/backoff.hpp>
#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/detail/memory.hpp>
#include <serial-actor/outcome.hpp>

namespace serial_actor { namespace detail {

    enum class reply_slot : uint8_t {
        pending = 0,
        setting = 1,
        ready = 2,
        cancelled = 3,
    };

    /// @brief One-shot outcome slot shared by the execution loop and one waiter
    ///
    /// pending -> setting -> ready, or pending -> cancelled. The first writer
    /// wins; every later set() or cancel() is a no-op that returns false.
    class reply_state final {
    public:
        explicit reply_state(std::pmr::memory_resource* resource) noexcept
            : resource_(resource)
            , slot_(reply_slot::pending)
            , refcount_(1) {
            assert(resource_);
        }

        reply_state(const reply_state&) = delete;
        reply_state& operator=(const reply_state&) = delete;

        ~reply_state() = default;

        void add_ref() noexcept {
            refcount_.fetch_add(1, std::memory_order_relaxed);
        }

        void release() noexcept {
            int old_value = refcount_.fetch_sub(1, std::memory_order_release);
            assert(old_value > 0 && "Refcount underflow!");
            if (old_value == 1) {
                std::atomic_thread_fence(std::memory_order_acquire);
                pmr::deallocate_ptr(resource_, this);
            }
        }

        bool set(outcome value) noexcept {
            auto expected = reply_slot::pending;
            if (!slot_.compare_exchange_strong(expected, reply_slot::setting,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
                return false;
            }
            value_ = value;
            slot_.store(reply_slot::ready, std::memory_order_release);
#if SERIAL_ACTOR_HAVE_ATOMIC_WAIT
            slot_.notify_all();
#endif
            return true;
        }

        bool cancel() noexcept {
            auto expected = reply_slot::pending;
            if (slot_.compare_exchange_strong(expected, reply_slot::cancelled,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
#if SERIAL_ACTOR_HAVE_ATOMIC_WAIT
                slot_.notify_all();
#endif
                return true;
            }
            return false;
        }

        [[nodiscard]] bool is_ready() const noexcept {
            return slot_.load(std::memory_order_acquire) == reply_slot::ready;
        }

        [[nodiscard]] bool is_cancelled() const noexcept {
            return slot_.load(std::memory_order_acquire) == reply_slot::cancelled;
        }

        [[nodiscard]] bool is_pending() const noexcept {
            auto s = slot_.load(std::memory_order_acquire);
            return s == reply_slot::pending || s == reply_slot::setting;
        }

        void wait() const noexcept {
#if SERIAL_ACTOR_HAVE_ATOMIC_WAIT
            for (auto current = slot_.load(std::memory_order_acquire);
                 current == reply_slot::pending || current == reply_slot::setting;
                 current = slot_.load(std::memory_order_acquire)) {
                slot_.wait(current, std::memory_order_acquire);
            }
#else
            int attempt = 0;
            while (is_pending()) {
                exponential_backoff(attempt);
            }
#endif
        }

        /// @return false when the deadline passed while still pending
        template<class Clock, class Duration>
        bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const noexcept {
            int attempt = 0;
            while (is_pending()) {
                if (Clock::now() >= deadline) {
                    return false;
                }
                exponential_backoff(attempt);
            }
            return true;
        }

        [[nodiscard]] const outcome& value() const noexcept {
            assert(is_ready() && "value(): reply not written yet");
            return value_;
        }

        [[nodiscard]] std::pmr::memory_resource* memory_resource() const noexcept {
            return resource_;
        }

    private:
        std::pmr::memory_resource* resource_;
        std::atomic<reply_slot> slot_;
        std::atomic<int> refcount_;
        outcome value_;
    };

    inline void intrusive_ptr_add_ref(reply_state* p) noexcept {
        p->add_ref();
    }

    inline void intrusive_ptr_release(reply_state* p) noexcept {
        p->release();
    }

    inline intrusive_ptr<reply_state> make_reply_state(std::pmr::memory_resource* resource) {
        return intrusive_ptr<reply_state>(pmr::allocate_ptr<reply_state>(resource, resource), adopt_ref);
    }

}} // namespace serial_actor::detail
