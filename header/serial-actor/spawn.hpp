#pragma once

#include <memory_resource>

#include <serial-actor/actor_config.hpp>
#include <serial-actor/actor_handle.hpp>

namespace serial_actor {

    /// Starts a new actor on its own thread. Messages and reply slots are
    /// allocated from `resource`, which must outlive the actor.
    actor_handle spawn(std::pmr::memory_resource* resource, actor_config config = {});

    actor_handle spawn(actor_config config = {});

} // namespace serial_actor
