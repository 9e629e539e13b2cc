#pragma once

#include <mutex>
#include <thread>

#include <serial-actor/actor/actor_core.hpp>
#include <serial-actor/actor_config.hpp>
#include <serial-actor/detail/intrusive_ptr.hpp>
#include <serial-actor/detail/ref_counted.hpp>

namespace serial_actor { namespace actor {

    /// @brief Control block shared by every handle of one actor
    ///
    /// Owns the loop thread. Its destruction, which happens when the last
    /// handle goes away, stops the actor with the configured shutdown policy.
    class actor_control final : public detail::ref_counted<actor_control> {
    public:
        explicit actor_control(intrusive_ptr<actor_core> core);
        ~actor_control();

        /// Launches the loop thread. Called once, by spawn().
        void start();

        /// Safe to call repeatedly and from inside a task. Outside the loop
        /// thread it returns after the loop has exited.
        void stop(shutdown_policy policy);

        actor_core& core() const noexcept {
            return *core_;
        }

    private:
        void join_or_detach();

        intrusive_ptr<actor_core> core_;
        std::mutex join_lock_;
        std::thread thread_;
    };

}} // namespace serial_actor::actor
