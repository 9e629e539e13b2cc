#pragma once

#include <serial-actor/config.hpp>
#include <serial-actor/error.hpp>
#include <serial-actor/log.hpp>
#include <serial-actor/outcome.hpp>
#include <serial-actor/task.hpp>

#include <serial-actor/actor/actor_state.hpp>
#include <serial-actor/actor_config.hpp>
#include <serial-actor/actor_handle.hpp>
#include <serial-actor/pending_reply.hpp>
#include <serial-actor/spawn.hpp>
