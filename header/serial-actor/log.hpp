#pragma once

#include <memory>

#include <serial-actor/config.hpp>

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SERIAL_ACTOR_LOG_LEVEL
#endif

#include <spdlog/spdlog.h>

// The library logs through one named logger that discards everything until
// the application installs its own with set_logger().

namespace serial_actor {

    namespace detail {

        std::shared_ptr<spdlog::logger> logger();

    } // namespace detail

    /// Replaces the library logger; nullptr restores the silent default.
    void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace serial_actor

#define SERIAL_ACTOR_TRACE(...) SPDLOG_LOGGER_TRACE(::serial_actor::detail::logger(), __VA_ARGS__)
#define SERIAL_ACTOR_DEBUG(...) SPDLOG_LOGGER_DEBUG(::serial_actor::detail::logger(), __VA_ARGS__)
#define SERIAL_ACTOR_INFO(...) SPDLOG_LOGGER_INFO(::serial_actor::detail::logger(), __VA_ARGS__)
#define SERIAL_ACTOR_WARN(...) SPDLOG_LOGGER_WARN(::serial_actor::detail::logger(), __VA_ARGS__)
#define SERIAL_ACTOR_ERROR(...) SPDLOG_LOGGER_ERROR(::serial_actor::detail::logger(), __VA_ARGS__)
