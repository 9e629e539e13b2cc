#pragma once

// clang-format off
#include <serial-actor.hpp>

#include <serial-actor/impl/error.ipp>
#include <serial-actor/impl/log.ipp>

#include <serial-actor/impl/mailbox/message.ipp>
#include <serial-actor/impl/mailbox/default_mailbox.ipp>

#include <serial-actor/impl/actor/actor_core.ipp>
#include <serial-actor/impl/actor/actor_control.ipp>

#include <serial-actor/impl/pending_reply.ipp>
#include <serial-actor/impl/actor_handle.ipp>
#include <serial-actor/impl/spawn.ipp>

// clang-format on
