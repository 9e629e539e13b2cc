#pragma once

#include <cassert>
#include <exception>
#include <utility>

#include <serial-actor/actor/actor_core.hpp>
#include <serial-actor/log.hpp>

namespace serial_actor { namespace actor {

    namespace {

        std::string make_actor_name(const std::string& configured, actor_id id) {
            if (!configured.empty()) {
                return configured;
            }
            return "actor-" + std::to_string(id);
        }

    } // namespace

    actor_core::actor_core(std::pmr::memory_resource* resource, actor_id id, actor_config config)
        : resource_(resource)
        , id_(id)
        , config_(std::move(config))
        , name_(make_actor_name(config_.name, id))
        , mailbox_(config_.capacity) {
        assert(resource_ && "actor_core: null memory resource");
        assert(config_.max_throughput > 0 && "max_throughput must be greater than 0");
    }

    actor_core::~actor_core() = default;

    std::error_code actor_core::enqueue(task_t&& body, push_mode mode, std::chrono::nanoseconds timeout) {
        assert(body && "enqueue(): empty task");
        if (config_.poison == poison_policy::reject_on_send && state() == actor_state::poisoned) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return make_error_code(error::poisoned);
        }
        return push(mailbox::make_message(resource_, std::move(body)), mode, timeout);
    }

    intrusive_ptr<detail::reply_state> actor_core::enqueue_with_reply(task_t&& body, push_mode mode,
                                                                      std::chrono::nanoseconds timeout,
                                                                      std::error_code& refused) {
        assert(body && "enqueue_with_reply(): empty task");
        auto reply = detail::make_reply_state(resource_);
        if (config_.poison == poison_policy::reject_on_send && state() == actor_state::poisoned) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            reply->set(outcome::from_error(error::poisoned));
            refused = make_error_code(error::poisoned);
            return reply;
        }
        refused = push(mailbox::make_message(resource_, std::move(body), reply), mode, timeout);
        if (refused) {
            SERIAL_ACTOR_TRACE("{}: submission refused: {}", name_, refused.message());
        }
        return reply;
    }

    std::error_code actor_core::push(mailbox::message_ptr msg, push_mode mode, std::chrono::nanoseconds timeout) {
        // The loop thread cannot wait for room it alone can make.
        if (mode == push_mode::blocking && on_loop_thread()) {
            mode = push_mode::try_once;
        }
        detail::enqueue_result result;
        switch (mode) {
            case push_mode::blocking:
                result = mailbox_.push_back(std::move(msg));
                break;
            case push_mode::try_once:
                result = mailbox_.try_push_back(std::move(msg));
                break;
            case push_mode::timed:
                result = mailbox_.push_back_for(std::move(msg), timeout);
                break;
            default:
                assert(false && "push_mode: unreachable");
                result = mailbox_.push_back(std::move(msg));
                break;
        }

        switch (result) {
            case detail::enqueue_result::success:
            case detail::enqueue_result::unblocked_reader:
                return {};
            case detail::enqueue_result::queue_closed:
                return make_error_code(error::closed);
            case detail::enqueue_result::queue_full:
            case detail::enqueue_result::timeout:
                return make_error_code(error::queue_full);
        }
        assert(false && "enqueue_result: unreachable");
        return make_error_code(error::closed);
    }

    resume_info actor_core::resume(max_throughput_t max_throughput) {
        assert(max_throughput > 0 && "max_throughput must be greater than 0");

        std::size_t handled = 0;
        while (handled < max_throughput) {
            // closed() is read before the queue is touched: once it is true no
            // producer can slip a message in behind the check
            const bool closed = mailbox_.closed();

            if (abort_requested_.load(std::memory_order_acquire)) {
                discard_remaining();
                return {closed ? resume_result::done : resume_result::awaiting, handled};
            }

            auto msg = mailbox_.pop_front();
            if (!msg) {
                return {closed ? resume_result::done : resume_result::awaiting, handled};
            }

            invoke(msg.get());
            ++handled;
        }

        return {resume_result::resume, handled};
    }

    void actor_core::run() {
        loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
        SERIAL_ACTOR_DEBUG("{}: loop started", name_);

        for (;;) {
            auto info = resume(config_.max_throughput);
            if (info.result == resume_result::done) {
                break;
            }
            if (info.result == resume_result::awaiting) {
                mailbox_.wait();
            }
        }

        lifecycle_.store(lifecycle::stopped, std::memory_order_release);
        SERIAL_ACTOR_DEBUG("{}: loop finished, processed={} rejected={}",
                           name_, processed(), rejected());
    }

    void actor_core::request_stop(shutdown_policy policy) {
        if (policy == shutdown_policy::abort) {
            abort_requested_.store(true, std::memory_order_release);
        }

        auto expected = lifecycle::alive;
        if (lifecycle_.compare_exchange_strong(expected, lifecycle::stopping,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
            SERIAL_ACTOR_INFO("{}: stopping ({})", name_, to_string(policy));
        }

        auto queued = mailbox_.close();
        if (queued != 0) {
            SERIAL_ACTOR_DEBUG("{}: {} message(s) left at close", name_, queued);
        }
    }

    bool actor_core::on_loop_thread() const noexcept {
        return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    std::error_code actor_core::failure() const noexcept {
        if (state() != actor_state::poisoned) {
            return {};
        }
        return failure_;
    }

    void actor_core::invoke(mailbox::message* msg) {
        assert(msg->sequence() > last_sequence_ && "mailbox delivered out of order");
        last_sequence_ = msg->sequence();

        if (state() == actor_state::poisoned) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            SERIAL_ACTOR_DEBUG("{}: message #{} rejected, actor is poisoned", name_, msg->sequence());
            msg->reject(error::poisoned);
            return;
        }

        std::error_code ec;
        try {
            ec = msg->body()();
        } catch (const std::exception& e) {
            SERIAL_ACTOR_ERROR("{}: task #{} threw: {}", name_, msg->sequence(), e.what());
            ec = make_error_code(error::task_exception);
        } catch (...) {
            SERIAL_ACTOR_ERROR("{}: task #{} threw a non-standard exception", name_, msg->sequence());
            ec = make_error_code(error::task_exception);
        }
        processed_.fetch_add(1, std::memory_order_relaxed);

        // captures go away before the waiter wakes up
        msg->body().reset();

        if (ec) {
            poison(msg->sequence(), ec);
            msg->deliver(outcome::failure(ec));
        } else {
            msg->deliver(outcome::success());
        }
    }

    void actor_core::poison(mailbox::message_id culprit, std::error_code ec) {
        assert(state() == actor_state::running && "poison(): actor already poisoned");
        failure_ = ec;
        state_.store(actor_state::poisoned, std::memory_order_release);

        SERIAL_ACTOR_WARN("{}: poisoned by task #{}: {} [{}:{}]",
                          name_, culprit, ec.message(), ec.category().name(), ec.value());

        if (config_.on_failure) {
            try {
                config_.on_failure(id_, ec);
            } catch (const std::exception& e) {
                SERIAL_ACTOR_ERROR("{}: failure handler threw: {}", name_, e.what());
            } catch (...) {
                SERIAL_ACTOR_ERROR("{}: failure handler threw a non-standard exception", name_);
            }
        }
    }

    std::size_t actor_core::discard_remaining() {
        auto leftovers = mailbox_.drain();
        std::size_t count = 0;
        while (auto msg = leftovers.pop_front()) {
            msg->reject(error::shutdown);
            ++count;
        }
        if (count != 0) {
            rejected_.fetch_add(count, std::memory_order_relaxed);
            SERIAL_ACTOR_DEBUG("{}: discarded {} message(s) on abort", name_, count);
        }
        return count;
    }

}} // namespace serial_actor::actor
