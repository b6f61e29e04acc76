#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include "codec/message_codec.hpp"

using namespace tether;
using tether::codec::MessageCodec;

namespace {

const std::string kTradePayload =
    R"({"e":"trade","E":1699500000000,"s":"BTCUSDT","t":12345,"p":"42150.50","q":"1.5","T":1699500000000,"m":true})";

const std::string kDepthPayload =
    R"({"lastUpdateId":160,"bids":[["0.0024","10"],["0.0023","5"],["0.0022","8"]],)"
    R"("asks":[["0.0026","100"],["0.0027","20"],["0.0028","7"]]})";

}  // namespace

static void BM_DecodeTrade(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(MessageCodec::decode(kTradePayload, false));
    }
    state.SetBytesProcessed(state.iterations() * kTradePayload.size());
}
BENCHMARK(BM_DecodeTrade);

static void BM_DecodeDepth(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(MessageCodec::decode(kDepthPayload, false));
    }
    state.SetBytesProcessed(state.iterations() * kDepthPayload.size());
}
BENCHMARK(BM_DecodeDepth);

// Invalid JSON falls back to raw text
static void BM_DecodeRawFallback(benchmark::State& state) {
    const std::string payload = "pong " + kTradePayload;
    for (auto _ : state) {
        benchmark::DoNotOptimize(MessageCodec::decode(payload, false));
    }
}
BENCHMARK(BM_DecodeRawFallback);

static void BM_EncodeTrade(benchmark::State& state) {
    const auto value = nlohmann::json::parse(kTradePayload);
    for (auto _ : state) {
        benchmark::DoNotOptimize(MessageCodec::encode(value));
    }
}
BENCHMARK(BM_EncodeTrade);

static void BM_FormatSubscription(benchmark::State& state) {
    std::uint64_t id = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            MessageCodec::encode(MessageCodec::format_subscription("SUBSCRIBE", "btcusdt@trade", ++id)));
    }
}
BENCHMARK(BM_FormatSubscription);

BENCHMARK_MAIN();
