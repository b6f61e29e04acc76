#include <benchmark/benchmark.h>
#include <string>
#include <thread>
#include "codec/message_codec.hpp"
#include "queue/bounded_queue.hpp"

using namespace tether;

// Benchmark single push/pop cycle
static void BM_BoundedQueuePushPop(benchmark::State& state) {
    BoundedQueue<int> queue(1000);
    for (auto _ : state) {
        benchmark::DoNotOptimize(queue.try_push(42));
        benchmark::DoNotOptimize(queue.try_pop());
    }
}
BENCHMARK(BM_BoundedQueuePushPop);

// Benchmark batch push then batch pop
static void BM_BoundedQueueBatchPushPop(benchmark::State& state) {
    constexpr std::size_t kBatchSize = 1000;
    BoundedQueue<int> queue(kBatchSize);

    for (auto _ : state) {
        for (std::size_t i = 0; i < kBatchSize; ++i) {
            benchmark::DoNotOptimize(queue.try_push(static_cast<int>(i)));
        }
        for (std::size_t i = 0; i < kBatchSize; ++i) {
            benchmark::DoNotOptimize(queue.try_pop());
        }
    }
    state.SetItemsProcessed(state.iterations() * kBatchSize * 2);
}
BENCHMARK(BM_BoundedQueueBatchPushPop);

// Decoded messages as the read loop queues them
static void BM_BoundedQueueMessage(benchmark::State& state) {
    BoundedQueue<Message> queue(1000);
    const std::string payload = R"({"e":"trade","E":1699500000000,"s":"BTCUSDT","p":"42150.50","q":"1.5"})";

    for (auto _ : state) {
        benchmark::DoNotOptimize(queue.try_push(codec::MessageCodec::decode(payload, false)));
        benchmark::DoNotOptimize(queue.try_pop());
    }
    state.SetBytesProcessed(state.iterations() * payload.size());
}
BENCHMARK(BM_BoundedQueueMessage);

// Producer thread feeding a blocking consumer through a small queue
static void BM_BoundedQueueProducerConsumer(benchmark::State& state) {
    const auto capacity = static_cast<std::size_t>(state.range(0));
    constexpr int kItems = 10000;

    for (auto _ : state) {
        BoundedQueue<int> queue(capacity);
        std::thread producer([&queue]() {
            for (int i = 0; i < kItems; ++i) {
                int value = i;
                while (!queue.try_push(std::move(value))) {
                    std::this_thread::yield();
                }
            }
            queue.close();
        });

        while (auto item = queue.pop()) {
            benchmark::DoNotOptimize(*item);
        }
        producer.join();
    }
    state.SetItemsProcessed(state.iterations() * kItems);
}
BENCHMARK(BM_BoundedQueueProducerConsumer)->Range(8, 1024);

BENCHMARK_MAIN();
