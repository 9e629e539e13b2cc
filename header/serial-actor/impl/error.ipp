#pragma once

#include <string>

#include <serial-actor/error.hpp>

namespace serial_actor {

    namespace {

        class error_category_impl final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "serial-actor";
            }

            std::string message(int value) const override {
                switch (static_cast<error>(value)) {
                    case error::closed:
                        return "actor is stopped";
                    case error::queue_full:
                        return "mailbox is full";
                    case error::poisoned:
                        return "actor is poisoned by an earlier failure";
                    case error::shutdown:
                        return "discarded by shutdown before running";
                    case error::timeout:
                        return "timed out waiting for the reply";
                    case error::task_exception:
                        return "task threw an exception";
                }
                return "unknown serial-actor error";
            }
        };

    } // namespace

    const std::error_category& error_category() noexcept {
        static const error_category_impl instance;
        return instance;
    }

    std::error_code make_error_code(error e) noexcept {
        return {static_cast<int>(e), error_category()};
    }

} // namespace serial_actor
