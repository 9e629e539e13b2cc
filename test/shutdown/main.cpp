#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <serial-actor.hpp>
#include <test/tooltestsuites/gate.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace serial_actor;
using serial_actor::test::arrival;
using serial_actor::test::eventually;
using serial_actor::test::gate;

TEST_CASE("shutdown - dropping the last handle drains queued work", "[shutdown]") {
    constexpr int queued = 50;
    gate hold;
    arrival started;
    std::atomic<int> ran{0};

    auto actor = spawn();
    REQUIRE_FALSE(actor.send([&] {
        started.arrive();
        hold.wait();
    }));
    REQUIRE(started.wait_for(1));
    for (int i = 0; i < queued; ++i) {
        REQUIRE_FALSE(actor.send([&ran] { ++ran; }));
    }
    REQUIRE(actor.pending() == queued);

    std::thread opener([&hold] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        hold.open();
    });
    // blocks until the loop has run everything
    actor.reset();
    opener.join();

    REQUIRE_FALSE(actor.valid());
    REQUIRE(ran.load() == queued);
}

TEST_CASE("shutdown - stop(abort) answers queued work with shutdown", "[shutdown]") {
    gate hold;
    arrival started;
    std::atomic<int> ran{0};

    auto actor = spawn();
    REQUIRE_FALSE(actor.send([&] {
        started.arrive();
        hold.wait();
    }));
    REQUIRE(started.wait_for(1));

    std::vector<pending_reply> replies;
    for (int i = 0; i < 5; ++i) {
        replies.push_back(actor.submit([&ran] { ++ran; }));
    }

    std::thread stopper([actor]() mutable { actor.stop(shutdown_policy::abort); });
    REQUIRE(eventually([&actor] { return actor.lifecycle_state() != lifecycle::alive; }));
    hold.open();
    stopper.join();

    for (auto& reply : replies) {
        REQUIRE(std::move(reply).get().kind() == outcome_kind::shutdown);
    }
    REQUIRE(ran.load() == 0);
    REQUIRE(actor.rejected() == 5);
    REQUIRE(actor.lifecycle_state() == lifecycle::stopped);
}

TEST_CASE("shutdown - abort configured as the release policy", "[shutdown]") {
    gate hold;
    arrival started;
    std::atomic<int> ran{0};
    pending_reply reply;
    {
        actor_config config;
        config.shutdown = shutdown_policy::abort;
        auto actor = spawn(config);
        REQUIRE_FALSE(actor.send([&] {
            started.arrive();
            hold.wait();
        }));
        REQUIRE(started.wait_for(1));
        reply = actor.submit([&ran] { ++ran; });

        std::thread opener([&hold] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            hold.open();
        });
        actor.reset();
        opener.join();
    }
    REQUIRE(std::move(reply).get().kind() == outcome_kind::shutdown);
    REQUIRE(ran.load() == 0);
}

TEST_CASE("shutdown - graceful stop runs queued replies", "[shutdown]") {
    auto actor = spawn();
    std::vector<pending_reply> replies;
    for (int i = 0; i < 10; ++i) {
        replies.push_back(actor.submit([] {}));
    }
    actor.stop();
    for (auto& reply : replies) {
        REQUIRE(std::move(reply).get().ok());
    }
    REQUIRE(actor.processed() == 10);
}

TEST_CASE("shutdown - sends after stop are refused with closed", "[shutdown]") {
    auto actor = spawn();
    actor.stop();
    REQUIRE(actor.lifecycle_state() == lifecycle::stopped);

    REQUIRE(actor.send([] {}) == error::closed);
    REQUIRE(actor.try_send([] {}) == error::closed);
    REQUIRE(actor.send_for([] {}, std::chrono::milliseconds(1)) == error::closed);
    REQUIRE(actor.send_and_wait([] {}).kind() == outcome_kind::closed);
    REQUIRE(actor.send_and_wait_for([] {}, std::chrono::milliseconds(10)).kind() == outcome_kind::closed);

    // idempotent, in either policy
    actor.stop();
    actor.stop(shutdown_policy::abort);
    REQUIRE(actor.lifecycle_state() == lifecycle::stopped);
    REQUIRE(actor.state() == actor_state::running);
}

TEST_CASE("shutdown - stop from inside a task", "[shutdown]") {
    gate hold;
    std::atomic<int> ran{0};
    auto actor = spawn();
    auto self = actor;
    REQUIRE_FALSE(actor.send([self, &hold]() mutable {
        hold.wait();
        self.stop();
    }));
    REQUIRE_FALSE(actor.send([&ran] { ++ran; }));
    hold.open();
    REQUIRE(eventually([&actor] { return actor.lifecycle_state() == lifecycle::stopped; }));
    // the mailbox was closed behind the second task, which still ran
    REQUIRE(ran.load() == 1);
    REQUIRE(actor.send([] {}) == error::closed);
}

TEST_CASE("shutdown - last handle released by a task", "[shutdown]") {
    std::atomic<bool> finished{false};
    {
        auto actor = spawn();
        auto captured = actor;
        REQUIRE_FALSE(actor.send([captured = std::move(captured), &finished]() mutable {
            captured.reset();
            finished = true;
        }));
        actor.reset();
    }
    REQUIRE(eventually([&finished] { return finished.load(); }));
}

TEST_CASE("shutdown - stop wakes a producer blocked on a full mailbox", "[shutdown]") {
    gate hold;
    arrival started;
    actor_config config;
    config.capacity = 1;
    auto actor = spawn(config);

    REQUIRE_FALSE(actor.send([&] {
        started.arrive();
        hold.wait();
    }));
    REQUIRE(started.wait_for(1));
    REQUIRE_FALSE(actor.send([] {}));

    std::atomic<bool> refused{false};
    std::thread producer([actor, &refused]() mutable {
        refused = actor.send([] {}) == error::closed;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::thread stopper([actor]() mutable { actor.stop(); });
    producer.join();
    REQUIRE(refused.load());

    hold.open();
    stopper.join();
    REQUIRE(actor.lifecycle_state() == lifecycle::stopped);
    REQUIRE(actor.processed() == 2);
}
