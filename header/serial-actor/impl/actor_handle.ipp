#pragma once

#include <utility>

#include <serial-actor/actor_handle.hpp>

namespace serial_actor {

    actor_handle::actor_handle(intrusive_ptr<actor::actor_control> control) noexcept
        : control_(std::move(control)) {}

    void actor_handle::stop(shutdown_policy policy) {
        assert(control_ && "stop() on an empty actor_handle");
        control_->stop(policy);
    }

    actor_state actor_handle::state() const noexcept {
        return core().state();
    }

    bool actor_handle::poisoned() const noexcept {
        return state() == actor_state::poisoned;
    }

    std::error_code actor_handle::failure() const noexcept {
        return core().failure();
    }

    lifecycle actor_handle::lifecycle_state() const noexcept {
        return core().lifecycle_state();
    }

    actor_id actor_handle::id() const noexcept {
        return core().id();
    }

    const std::string& actor_handle::name() const noexcept {
        return core().name();
    }

    std::size_t actor_handle::pending() const {
        return core().pending();
    }

    std::size_t actor_handle::processed() const noexcept {
        return core().processed();
    }

    std::size_t actor_handle::rejected() const noexcept {
        return core().rejected();
    }

    std::size_t actor_handle::use_count() const noexcept {
        return control_ ? control_->use_count() : 0;
    }

    outcome actor_handle::await_until(pending_reply reply, std::chrono::steady_clock::time_point deadline) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining < std::chrono::steady_clock::duration::zero()) {
            remaining = std::chrono::steady_clock::duration::zero();
        }
        return std::move(reply).get_for(remaining);
    }

} // namespace serial_actor
