#pragma once

#include <cassert>
#include <cstdint>
#include <system_error>

#include <serial-actor/error.hpp>

namespace serial_actor {

    enum class outcome_kind : uint8_t {
        success,
        failure,
        poisoned,
        shutdown,
        closed,
        timeout
    };

    constexpr const char* to_string(outcome_kind kind) noexcept {
        switch (kind) {
            case outcome_kind::success:
                return "success";
            case outcome_kind::failure:
                return "failure";
            case outcome_kind::poisoned:
                return "poisoned";
            case outcome_kind::shutdown:
                return "shutdown";
            case outcome_kind::closed:
                return "closed";
            case outcome_kind::timeout:
                return "timeout";
        }
        return "unknown";
    }

    /// @brief Result delivered to a submit-and-wait caller
    ///
    /// `success` and `failure` mean the task ran. Every other kind is a
    /// sentinel: the task body was never invoked (or, for `timeout`, the
    /// caller stopped waiting for it).
    class outcome final {
    public:
        outcome() noexcept = default;

        static outcome success() noexcept {
            return outcome();
        }

        static outcome failure(std::error_code ec) noexcept {
            assert(ec && "failure outcome requires a non-empty error code");
            return outcome(outcome_kind::failure, ec);
        }

        static outcome from_error(serial_actor::error e) noexcept {
            switch (e) {
                case error::poisoned:
                    return outcome(outcome_kind::poisoned, e);
                case error::shutdown:
                    return outcome(outcome_kind::shutdown, e);
                case error::closed:
                    return outcome(outcome_kind::closed, e);
                case error::timeout:
                    return outcome(outcome_kind::timeout, e);
                default:
                    return outcome(outcome_kind::failure, e);
            }
        }

        [[nodiscard]] outcome_kind kind() const noexcept {
            return kind_;
        }

        [[nodiscard]] std::error_code error() const noexcept {
            return error_;
        }

        [[nodiscard]] bool ok() const noexcept {
            return kind_ == outcome_kind::success;
        }

        /// true when the task body was invoked, whatever it returned
        [[nodiscard]] bool ran() const noexcept {
            return kind_ == outcome_kind::success || kind_ == outcome_kind::failure;
        }

        explicit operator bool() const noexcept {
            return ok();
        }

        friend bool operator==(const outcome&, const outcome&) noexcept = default;

    private:
        outcome(outcome_kind kind, std::error_code ec) noexcept
            : kind_(kind)
            , error_(ec) {}

        outcome_kind kind_ = outcome_kind::success;
        std::error_code error_;
    };

} // namespace serial_actor
