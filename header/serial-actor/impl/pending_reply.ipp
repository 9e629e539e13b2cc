#pragma once

#include <utility>

#include <serial-actor/pending_reply.hpp>

namespace serial_actor {

    pending_reply::pending_reply(intrusive_ptr<detail::reply_state> state) noexcept
        : state_(std::move(state)) {}

    pending_reply::pending_reply(pending_reply&& other) noexcept
        : state_(std::move(other.state_)) {}

    pending_reply& pending_reply::operator=(pending_reply&& other) noexcept {
        if (this != &other) {
            cancel();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    pending_reply::~pending_reply() noexcept {
        cancel();
    }

    void pending_reply::wait() const {
        assert(state_ && "wait() on invalid reply");
        state_->wait();
    }

    outcome pending_reply::get() && {
        assert(state_ && "get() on invalid reply");
        state_->wait();
        assert(state_->is_ready() && "get() on cancelled reply");
        outcome result = state_->value();
        state_ = nullptr;
        return result;
    }

    void pending_reply::cancel() noexcept {
        if (state_) {
            state_->cancel();
            state_ = nullptr;
        }
    }

} // namespace serial_actor
