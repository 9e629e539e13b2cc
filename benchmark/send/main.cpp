#include <benchmark/benchmark.h>
#include <serial-actor.hpp>

#include <atomic>
#include <memory_resource>
#include <thread>
#include <vector>

class SendFixture : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State& st) override {
        serial_actor::actor_config config;
        config.name = "bench";
        config.capacity = static_cast<std::size_t>(st.range(0));
        actor_ = serial_actor::spawn(&pool_, config);
        counter_ = 0;
    }

    void TearDown(const benchmark::State&) override {
        actor_.stop();
        actor_.reset();
    }

protected:
    std::pmr::synchronized_pool_resource pool_;
    serial_actor::actor_handle actor_;
    std::atomic<std::size_t> counter_{0};
};

// fire-and-forget, one producer; the loop keeps up in the background
BENCHMARK_DEFINE_F(SendFixture, FireAndForget)(benchmark::State& st) {
    for (auto _ : st) {
        auto ec = actor_.send([this] { counter_.fetch_add(1, std::memory_order_relaxed); });
        benchmark::DoNotOptimize(ec);
    }
    auto last = actor_.send_and_wait([] {});
    benchmark::DoNotOptimize(last);
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK_REGISTER_F(SendFixture, FireAndForget)->Arg(0)->Arg(64)->Arg(1024);

// full round trip through the reply slot
BENCHMARK_DEFINE_F(SendFixture, SendAndWait)(benchmark::State& st) {
    for (auto _ : st) {
        auto result = actor_.send_and_wait([this] { counter_.fetch_add(1, std::memory_order_relaxed); });
        benchmark::DoNotOptimize(result);
    }
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK_REGISTER_F(SendFixture, SendAndWait)->Arg(0);

static void ContendedProducers(benchmark::State& st) {
    const auto producers = static_cast<int>(st.range(0));
    constexpr int per_producer = 1000;
    for (auto _ : st) {
        serial_actor::actor_config config;
        config.capacity = 16;
        auto actor = serial_actor::spawn(config);
        std::atomic<int> ran{0};
        std::vector<std::thread> threads;
        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([&ran, handle = actor]() mutable {
                for (int i = 0; i < per_producer; ++i) {
                    auto ec = handle.send([&ran] { ran.fetch_add(1, std::memory_order_relaxed); });
                    benchmark::DoNotOptimize(ec);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        actor.stop();
        benchmark::DoNotOptimize(ran.load());
    }
    st.SetItemsProcessed(st.iterations() * producers * per_producer);
}
BENCHMARK(ContendedProducers)->Arg(1)->Arg(2)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
