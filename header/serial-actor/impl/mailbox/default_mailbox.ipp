#pragma once

#include <utility>

#include <serial-actor/mailbox/mailbox.hpp>

namespace serial_actor { namespace mailbox {

    using serial_actor::detail::enqueue_result;

    default_mailbox_impl::default_mailbox_impl(std::size_t capacity)
        : capacity_(capacity) {}

    default_mailbox_impl::~default_mailbox_impl() {
        std::lock_guard<std::mutex> guard(lock_);
        closed_.store(true, std::memory_order_release);
        while (auto msg = queue_.pop_front()) {
            msg->reject(error::shutdown);
        }
    }

    enqueue_result default_mailbox_impl::push_back_impl(message_ptr ptr) {
        std::unique_lock<std::mutex> guard(lock_);
        not_full_.wait(guard, [this] { return closed_.load(std::memory_order_relaxed) || !full(); });
        if (closed_.load(std::memory_order_relaxed)) {
            guard.unlock();
            return refuse(std::move(ptr), enqueue_result::queue_closed);
        }
        return accept(guard, std::move(ptr));
    }

    enqueue_result default_mailbox_impl::try_push_back_impl(message_ptr ptr) {
        std::unique_lock<std::mutex> guard(lock_);
        if (closed_.load(std::memory_order_relaxed)) {
            guard.unlock();
            return refuse(std::move(ptr), enqueue_result::queue_closed);
        }
        if (full()) {
            guard.unlock();
            return refuse(std::move(ptr), enqueue_result::queue_full);
        }
        return accept(guard, std::move(ptr));
    }

    enqueue_result default_mailbox_impl::push_back_for_impl(message_ptr ptr, std::chrono::nanoseconds timeout) {
        std::unique_lock<std::mutex> guard(lock_);
        const bool ready = not_full_.wait_for(guard, timeout, [this] {
            return closed_.load(std::memory_order_relaxed) || !full();
        });
        if (closed_.load(std::memory_order_relaxed)) {
            guard.unlock();
            return refuse(std::move(ptr), enqueue_result::queue_closed);
        }
        if (!ready) {
            guard.unlock();
            return refuse(std::move(ptr), enqueue_result::timeout);
        }
        return accept(guard, std::move(ptr));
    }

    message_ptr default_mailbox_impl::pop_front_impl() {
        std::unique_lock<std::mutex> guard(lock_);
        auto result = queue_.pop_front();
        guard.unlock();
        if (result && capacity_ != 0) {
            not_full_.notify_one();
        }
        return result;
    }

    void default_mailbox_impl::wait_impl() {
        std::unique_lock<std::mutex> guard(lock_);
        not_empty_.wait(guard, [this] { return closed_.load(std::memory_order_relaxed) || !queue_.empty(); });
    }

    bool default_mailbox_impl::closed_impl() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    std::size_t default_mailbox_impl::close_impl() {
        std::unique_lock<std::mutex> guard(lock_);
        closed_.store(true, std::memory_order_release);
        auto remaining = queue_.size();
        guard.unlock();
        not_empty_.notify_all();
        not_full_.notify_all();
        return remaining;
    }

    std::size_t default_mailbox_impl::size_impl() const {
        std::lock_guard<std::mutex> guard(lock_);
        return queue_.size();
    }

    std::size_t default_mailbox_impl::capacity_impl() const noexcept {
        return capacity_;
    }

    message_list default_mailbox_impl::drain_impl() {
        std::unique_lock<std::mutex> guard(lock_);
        message_list result(std::move(queue_));
        guard.unlock();
        not_full_.notify_all();
        return result;
    }

    bool default_mailbox_impl::full() const noexcept {
        return capacity_ != 0 && queue_.size() >= capacity_;
    }

    enqueue_result default_mailbox_impl::accept(std::unique_lock<std::mutex>& guard, message_ptr ptr) {
        const bool was_empty = queue_.empty();
        ptr->sequence(++accepted_);
        queue_.push_back(ptr.release());
        guard.unlock();
        if (was_empty) {
            not_empty_.notify_one();
            return enqueue_result::unblocked_reader;
        }
        return enqueue_result::success;
    }

    enqueue_result default_mailbox_impl::refuse(message_ptr ptr, enqueue_result why) noexcept {
        switch (why) {
            case enqueue_result::queue_closed:
                ptr->reject(error::closed);
                break;
            case enqueue_result::queue_full:
            case enqueue_result::timeout:
                ptr->reject(error::queue_full);
                break;
            default:
                break;
        }
        return why;
    }

}} // namespace serial_actor::mailbox
