#pragma once

#include <atomic>
#include <cassert>
#include <utility>

#include <serial-actor/actor/actor_control.hpp>
#include <serial-actor/actor/actor_core.hpp>
#include <serial-actor/spawn.hpp>

namespace serial_actor {

    namespace {

        actor_id next_actor_id() noexcept {
            static std::atomic<actor_id> counter{0};
            return counter.fetch_add(1, std::memory_order_relaxed) + 1;
        }

    } // namespace

    actor_handle spawn(std::pmr::memory_resource* resource, actor_config config) {
        assert(resource && "spawn(): null memory resource");
        assert(config.max_throughput > 0 && "spawn(): max_throughput must be greater than 0");

        auto core = make_counted<actor::actor_core>(resource, next_actor_id(), std::move(config));
        auto control = make_counted<actor::actor_control>(std::move(core));
        control->start();
        return actor_handle(std::move(control));
    }

    actor_handle spawn(actor_config config) {
        return spawn(std::pmr::get_default_resource(), std::move(config));
    }

} // namespace serial_actor
