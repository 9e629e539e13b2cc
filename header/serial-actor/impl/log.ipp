#pragma once

#include <atomic>
#include <memory>
#include <utility>

#include <spdlog/sinks/null_sink.h>

#include <serial-actor/log.hpp>

namespace serial_actor {

    namespace {

        constexpr const char* logger_name = "serial-actor";

        std::shared_ptr<spdlog::logger> make_silent_logger() {
            auto result = std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
            result->set_level(spdlog::level::off);
            return result;
        }

        std::atomic<std::shared_ptr<spdlog::logger>>& global_logger() {
            static std::atomic<std::shared_ptr<spdlog::logger>> slot{make_silent_logger()};
            return slot;
        }

    } // namespace

    namespace detail {

        std::shared_ptr<spdlog::logger> logger() {
            return global_logger().load(std::memory_order_acquire);
        }

    } // namespace detail

    void set_logger(std::shared_ptr<spdlog::logger> logger) {
        if (!logger) {
            logger = make_silent_logger();
        }
        global_logger().store(std::move(logger), std::memory_order_release);
    }

} // namespace serial_actor
