#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <serial-actor/detail/unique_function.hpp>
#include <serial-actor/task.hpp>
#include <test/tooltestsuites/test_memory_resource.hpp>

#include <memory>
#include <string>
#include <system_error>

using serial_actor::detail::unique_function;
using serial_actor::test::test_memory_resource;

namespace {

    int add(int a, int b) {
        return a + b;
    }

    struct small_functor {
        int value;

        int operator()(int x) const {
            return x + value;
        }
    };

    // does not fit the inline buffer
    struct large_functor {
        char payload[100];
        std::string name;

        explicit large_functor(std::string n)
            : name(std::move(n)) {
            for (std::size_t i = 0; i < sizeof(payload); ++i) {
                payload[i] = static_cast<char>(i);
            }
        }

        std::string operator()(int x) const {
            return name + ": " + std::to_string(x) + " " + std::to_string(static_cast<int>(payload[7]));
        }
    };

    struct throwing_move {
        throwing_move() = default;
        throwing_move(throwing_move&&) noexcept(false) {}

        int operator()() const {
            return 7;
        }
    };

} // namespace

TEST_CASE("unique_function - basic calls", "[unique_function]") {
    test_memory_resource resource;

    SECTION("function pointer") {
        unique_function<int(int, int)> f(&resource, &add);
        REQUIRE(f);
        REQUIRE(f(2, 3) == 5);
    }

    SECTION("small functor") {
        unique_function<int(int)> f(&resource, small_functor{10});
        REQUIRE(f(5) == 15);
    }

    SECTION("large functor") {
        unique_function<std::string(int)> f(&resource, large_functor("big"));
        REQUIRE(f(1) == "big: 1 7");
    }

    SECTION("null function pointer stays empty") {
        int (*nothing)(int, int) = nullptr;
        unique_function<int(int, int)> f(&resource, nothing);
        REQUIRE(f.empty());
        REQUIRE(f == nullptr);
    }
}

TEST_CASE("unique_function - small buffer", "[unique_function]") {
    test_memory_resource resource;

    SECTION("small functor does not allocate") {
        unique_function<int(int)> f(&resource, small_functor{1});
        REQUIRE(f.uses_small_buffer());
        REQUIRE(resource.allocations() == 0);
    }

    SECTION("large functor allocates from the given resource") {
        {
            unique_function<std::string(int)> f(&resource, large_functor("x"));
            REQUIRE_FALSE(f.uses_small_buffer());
            REQUIRE(resource.allocations() == 1);
        }
        REQUIRE(resource.all_deallocated());
    }

    SECTION("throwing move constructor goes to the heap") {
        {
            unique_function<int()> f(&resource, throwing_move{});
            REQUIRE_FALSE(f.uses_small_buffer());
            REQUIRE(f() == 7);
        }
        REQUIRE(resource.all_deallocated());
    }

    SECTION("capture that exactly fills the buffer") {
        struct exact {
            char bytes[unique_function<int()>::small_buffer_size];
            int operator()() const {
                return bytes[0];
            }
        };
        exact value{};
        value.bytes[0] = 3;
        unique_function<int()> f(&resource, value);
        REQUIRE(f.uses_small_buffer());
        REQUIRE(f() == 3);
    }
}

TEST_CASE("unique_function - move semantics", "[unique_function]") {
    test_memory_resource resource;

    SECTION("move small functor") {
        unique_function<int(int)> f1(&resource, small_functor{10});
        unique_function<int(int)> f2(std::move(f1));
        REQUIRE(f1.empty());
        REQUIRE(f2(5) == 15);
    }

    SECTION("move large functor keeps the single allocation") {
        {
            unique_function<std::string(int)> f1(&resource, large_functor("moved"));
            unique_function<std::string(int)> f2(std::move(f1));
            REQUIRE(f1.empty());
            REQUIRE(f2(2) == "moved: 2 7");
            REQUIRE(resource.allocations() == 1);
        }
        REQUIRE(resource.all_deallocated());
    }

    SECTION("move-only capture") {
        auto owned = std::make_unique<int>(41);
        unique_function<int()> f(&resource, [p = std::move(owned)] { return *p + 1; });
        unique_function<int()> g(std::move(f));
        REQUIRE(g() == 42);
    }

    SECTION("allocator-extended move rehomes heap storage") {
        test_memory_resource other;
        {
            unique_function<std::string(int)> f1(&resource, large_functor("home"));
            unique_function<std::string(int)> f2(&other, std::move(f1));
            REQUIRE(f2.resource() == &other);
            REQUIRE(f2(3) == "home: 3 7");
            REQUIRE(resource.all_deallocated());
            REQUIRE(other.allocations() == 1);
        }
        REQUIRE(other.all_deallocated());
    }
}

TEST_CASE("unique_function - reset, swap, assignment", "[unique_function]") {
    test_memory_resource resource;

    SECTION("reset releases heap storage") {
        unique_function<std::string(int)> f(&resource, large_functor("r"));
        f.reset();
        REQUIRE(f.empty());
        REQUIRE(resource.all_deallocated());
    }

    SECTION("assign nullptr") {
        unique_function<int(int)> f(&resource, small_functor{1});
        f = nullptr;
        REQUIRE_FALSE(f);
    }

    SECTION("swap small and large") {
        unique_function<int(int)> a(&resource, small_functor{1});
        unique_function<int(int)> b(&resource, [big = large_functor("b")](int x) { return x * 2 + static_cast<int>(big.name.size()); });
        a.swap(b);
        REQUIRE(a(10) == 21);
        REQUIRE(b(10) == 11);
    }

    SECTION("move assignment destroys the previous target") {
        auto counter = std::make_shared<int>(0);
        unique_function<int()> f(&resource, [counter] { return *counter; });
        REQUIRE(counter.use_count() == 2);
        f = unique_function<int()>(&resource, [] { return 0; });
        REQUIRE(counter.use_count() == 1);
    }
}

TEST_CASE("unique_function - task signature", "[unique_function]") {
    test_memory_resource resource;

    SECTION("empty code is success") {
        serial_actor::task_t task(&resource, [] { return std::error_code{}; });
        REQUIRE_FALSE(task());
    }

    SECTION("failure code is returned as is") {
        serial_actor::task_t task(&resource, [] { return std::make_error_code(std::errc::invalid_argument); });
        REQUIRE(task() == std::errc::invalid_argument);
    }

    SECTION("mutable state survives between calls") {
        int runs = 0;
        serial_actor::task_t task(&resource, [&runs, n = 0]() mutable {
            ++n;
            runs = n;
            return std::error_code{};
        });
        REQUIRE_FALSE(task());
        REQUIRE_FALSE(task());
        REQUIRE(runs == 2);
    }
}
