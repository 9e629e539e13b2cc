#pragma once

#include <cstdint>
#include <memory>
#include <memory_resource>
#include <type_traits>

#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/detail/reply_state.hpp>
#include <serial-actor/error.hpp>
#include <serial-actor/outcome.hpp>
#include <serial-actor/task.hpp>

namespace serial_actor { namespace mailbox {

    /// Position assigned by the mailbox when it accepts a message; 0 means not accepted.
    using message_id = uint64_t;

    class message final {
    public:
        message() = delete;
        message(const message&) = delete;
        message& operator=(const message&) = delete;

        message(std::pmr::memory_resource* resource, task_t&& body, intrusive_ptr<serial_actor::detail::reply_state> reply);

        /// A message dropped before anybody delivered to it answers `shutdown`.
        ~message() noexcept;

        std::pmr::memory_resource* resource() const noexcept;

        message_id sequence() const noexcept;
        void sequence(message_id id) noexcept;

        task_t& body() noexcept;

        bool expects_reply() const noexcept;

        void deliver(outcome result) noexcept;
        void reject(error reason) noexcept;

        /// intrusive link, owned by whichever list holds the message
        message* next = nullptr;

    private:
        std::pmr::memory_resource* resource_;
        message_id sequence_;
        task_t body_;
        intrusive_ptr<serial_actor::detail::reply_state> reply_;
    };

    static_assert(!std::is_copy_constructible_v<message>);

    struct message_deleter {
        void operator()(message* p) const noexcept;
    };

    static_assert(std::is_empty_v<message_deleter>, "EBO expected");

    using message_ptr = std::unique_ptr<message, message_deleter>;

    message_ptr make_message(std::pmr::memory_resource* resource,
                             task_t&& body,
                             intrusive_ptr<serial_actor::detail::reply_state> reply = nullptr);

}} // namespace serial_actor::mailbox
