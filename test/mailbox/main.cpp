#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <serial-actor/mailbox/mailbox.hpp>
#include <test/tooltestsuites/test_memory_resource.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace serial_actor;
using serial_actor::detail::enqueue_result;
using serial_actor::test::test_memory_resource;

namespace {

    mailbox::message_ptr make_counting(std::pmr::memory_resource* resource, std::vector<int>& log, int value,
                                       intrusive_ptr<serial_actor::detail::reply_state> reply = nullptr) {
        return mailbox::make_message(resource, task_t(resource, [&log, value] {
                                         log.push_back(value);
                                         return std::error_code{};
                                     }),
                                     std::move(reply));
    }

} // namespace

TEST_CASE("mailbox - fifo order and sequence ids", "[mailbox]") {
    test_memory_resource resource;
    std::vector<int> log;
    {
        mailbox::default_mailbox box;
        REQUIRE(box.empty());
        REQUIRE(box.capacity() == 0);

        REQUIRE(box.push_back(make_counting(&resource, log, 1)) == enqueue_result::unblocked_reader);
        REQUIRE(box.push_back(make_counting(&resource, log, 2)) == enqueue_result::success);
        REQUIRE(box.push_back(make_counting(&resource, log, 3)) == enqueue_result::success);
        REQUIRE(box.size() == 3);

        mailbox::message_id previous = 0;
        while (auto msg = box.pop_front()) {
            REQUIRE(msg->sequence() > previous);
            previous = msg->sequence();
            REQUIRE_FALSE(msg->body()());
        }
        REQUIRE(previous == 3);
    }
    REQUIRE(log == std::vector<int>{1, 2, 3});
    REQUIRE(resource.all_deallocated());
}

TEST_CASE("mailbox - bounded try and timed push", "[mailbox]") {
    test_memory_resource resource;
    std::vector<int> log;
    mailbox::default_mailbox box(1);
    REQUIRE(box.capacity() == 1);

    REQUIRE(detail::accepted(box.try_push_back(make_counting(&resource, log, 1))));

    SECTION("try push on a full mailbox answers queue_full") {
        auto reply = serial_actor::detail::make_reply_state(&resource);
        REQUIRE(box.try_push_back(make_counting(&resource, log, 2, reply)) == enqueue_result::queue_full);
        REQUIRE(reply->is_ready());
        REQUIRE(reply->value().error() == error::queue_full);
        REQUIRE(box.size() == 1);
    }

    SECTION("timed push gives up") {
        auto started = std::chrono::steady_clock::now();
        REQUIRE(box.push_back_for(make_counting(&resource, log, 2), std::chrono::milliseconds(20)) == enqueue_result::timeout);
        REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(20));
    }

    SECTION("timed push succeeds once the consumer makes room") {
        std::thread consumer([&box] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            auto msg = box.pop_front();
        });
        auto result = box.push_back_for(make_counting(&resource, log, 2), std::chrono::seconds(5));
        consumer.join();
        REQUIRE(detail::accepted(result));
        REQUIRE(box.size() == 1);
    }

    SECTION("blocking push waits for room") {
        std::atomic<bool> pushed{false};
        std::thread producer([&] {
            auto result = box.push_back(make_counting(&resource, log, 2));
            pushed = detail::accepted(result);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE_FALSE(pushed.load());
        auto first = box.pop_front();
        producer.join();
        REQUIRE(pushed.load());
        REQUIRE(first->sequence() == 1);
        REQUIRE(box.pop_front()->sequence() == 2);
    }
}

TEST_CASE("mailbox - close", "[mailbox]") {
    test_memory_resource resource;
    std::vector<int> log;
    mailbox::default_mailbox box(1);
    REQUIRE(detail::accepted(box.push_back(make_counting(&resource, log, 1))));

    SECTION("push after close resolves the reply with closed") {
        REQUIRE(box.close() == 1);
        REQUIRE(box.closed());
        auto reply = serial_actor::detail::make_reply_state(&resource);
        REQUIRE(box.push_back(make_counting(&resource, log, 2, reply)) == enqueue_result::queue_closed);
        REQUIRE(reply->value().kind() == outcome_kind::closed);
        // already queued work stays poppable
        REQUIRE(box.pop_front());
    }

    SECTION("close wakes a producer blocked on a full mailbox") {
        std::atomic<int> result{-1};
        std::thread producer([&] {
            result = static_cast<int>(box.push_back(make_counting(&resource, log, 2)));
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        box.close();
        producer.join();
        REQUIRE(result.load() == static_cast<int>(enqueue_result::queue_closed));
    }

    SECTION("close wakes the consumer") {
        REQUIRE(box.pop_front());
        std::atomic<bool> woke{false};
        std::thread consumer([&] {
            box.wait();
            woke = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE_FALSE(woke.load());
        box.close();
        consumer.join();
        REQUIRE(woke.load());
    }
}

TEST_CASE("mailbox - leftovers", "[mailbox]") {
    test_memory_resource resource;
    std::vector<int> log;
    auto first = serial_actor::detail::make_reply_state(&resource);
    auto second = serial_actor::detail::make_reply_state(&resource);

    SECTION("drain hands over everything") {
        mailbox::default_mailbox box;
        box.push_back(make_counting(&resource, log, 1, first));
        box.push_back(make_counting(&resource, log, 2, second));
        auto all = box.drain();
        REQUIRE(box.empty());
        REQUIRE(all.size() == 2);
        while (auto msg = all.pop_front()) {
            msg->reject(error::shutdown);
        }
        REQUIRE(first->value().kind() == outcome_kind::shutdown);
        REQUIRE(second->value().kind() == outcome_kind::shutdown);
    }

    SECTION("destroyed mailbox answers shutdown") {
        {
            mailbox::default_mailbox box;
            box.push_back(make_counting(&resource, log, 1, first));
            box.push_back(make_counting(&resource, log, 2, second));
        }
        REQUIRE(first->value().kind() == outcome_kind::shutdown);
        REQUIRE(second->value().kind() == outcome_kind::shutdown);
    }

    REQUIRE(log.empty());
}

TEST_CASE("mailbox - concurrent producers keep per-producer order", "[mailbox]") {
    constexpr int producers = 4;
    constexpr int per_producer = 500;
    mailbox::default_mailbox box(8);
    std::vector<int> log;
    auto* resource = std::pmr::get_default_resource();

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            for (int i = 0; i < per_producer; ++i) {
                box.push_back(make_counting(resource, log, p * per_producer + i));
            }
        });
    }

    int received = 0;
    while (received < producers * per_producer) {
        box.wait();
        while (auto msg = box.pop_front()) {
            REQUIRE_FALSE(msg->body()());
            ++received;
        }
    }
    for (auto& t : threads) {
        t.join();
    }

    std::vector<int> last(producers, -1);
    for (int value : log) {
        int p = value / per_producer;
        REQUIRE(value > last[p]);
        last[p] = value;
    }
    REQUIRE(log.size() == static_cast<std::size_t>(producers * per_producer));
}
