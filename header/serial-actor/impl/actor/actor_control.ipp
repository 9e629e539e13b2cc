#pragma once

#include <cassert>
#include <utility>

#include <serial-actor/actor/actor_control.hpp>
#include <serial-actor/log.hpp>

namespace serial_actor { namespace actor {

    actor_control::actor_control(intrusive_ptr<actor_core> core)
        : core_(std::move(core)) {
        assert(core_ && "actor_control: null core");
    }

    actor_control::~actor_control() {
        core_->request_stop(core_->config().shutdown);
        join_or_detach();
    }

    void actor_control::start() {
        std::lock_guard<std::mutex> guard(join_lock_);
        assert(!thread_.joinable() && "start(): loop already running");
        // the thread keeps its own reference so a detached loop outlives this block
        thread_ = std::thread([core = core_] { core->run(); });

        const auto& config = core_->config();
        SERIAL_ACTOR_INFO("{}: spawned (id={}, capacity={}, max_throughput={}, poison={}, shutdown={})",
                          core_->name(), core_->id(), config.capacity, config.max_throughput,
                          to_string(config.poison), to_string(config.shutdown));
    }

    void actor_control::stop(shutdown_policy policy) {
        core_->request_stop(policy);
        if (core_->on_loop_thread()) {
            return;
        }
        std::lock_guard<std::mutex> guard(join_lock_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void actor_control::join_or_detach() {
        std::lock_guard<std::mutex> guard(join_lock_);
        if (!thread_.joinable()) {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            SERIAL_ACTOR_DEBUG("{}: last handle released on the loop thread, detaching", core_->name());
            thread_.detach();
        } else {
            thread_.join();
        }
    }

}} // namespace serial_actor::actor
