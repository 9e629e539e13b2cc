#pragma once

#include <utility>

#include <serial-actor/detail/memory.hpp>
#include <serial-actor/mailbox/message.hpp>

namespace serial_actor { namespace mailbox {

    message::message(std::pmr::memory_resource* resource, task_t&& body, intrusive_ptr<serial_actor::detail::reply_state> reply)
        : resource_(resource)
        , sequence_(0)
        , body_(resource, std::move(body))
        , reply_(std::move(reply)) {}

    message::~message() noexcept {
        if (reply_) {
            reply_->set(outcome::from_error(error::shutdown));
        }
    }

    std::pmr::memory_resource* message::resource() const noexcept {
        return resource_;
    }

    message_id message::sequence() const noexcept {
        return sequence_;
    }

    void message::sequence(message_id id) noexcept {
        sequence_ = id;
    }

    task_t& message::body() noexcept {
        return body_;
    }

    bool message::expects_reply() const noexcept {
        return static_cast<bool>(reply_);
    }

    void message::deliver(outcome result) noexcept {
        if (reply_) {
            reply_->set(result);
            reply_.reset();
        }
    }

    void message::reject(error reason) noexcept {
        deliver(outcome::from_error(reason));
    }

    void message_deleter::operator()(message* p) const noexcept {
        if (p == nullptr) {
            return;
        }
        pmr::deallocate_ptr(p->resource(), p);
    }

    message_ptr make_message(std::pmr::memory_resource* resource,
                             task_t&& body,
                             intrusive_ptr<serial_actor::detail::reply_state> reply) {
        return message_ptr(pmr::allocate_ptr<message>(resource, resource, std::move(body), std::move(reply)));
    }

}} // namespace serial_actor::mailbox
