#include <benchmark/benchmark.h>
#include "mcphost/codec.hpp"
#include "mcphost/framer.hpp"
#include "mcphost/json_rpc.hpp"
#include <string>
#include <vector>

using namespace mcphost;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"read_file","arguments":{"path":"/workspace/README.md"}}})";

// tools/list response with N tools
static std::string make_tools_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Tool number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"path", {{"type", "string"}}}}},
                {"required", {"path"}}
            }},
            {"annotations", {{"readOnlyHint", i % 2 == 0}}}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kToolsResponse = make_tools_response(100);

// ---- Codec ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPingRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPingRequest.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseToolsList(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsResponse.size());
}
BENCHMARK(BM_ParseToolsList);

static void BM_ParseMalformed(benchmark::State& state) {
    const std::string bad = "{this is not valid json";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseMalformed);

static void BM_SerializeToolsList(benchmark::State& state) {
    auto msg = Codec::parse(kToolsResponse);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kToolsResponse.size());
}
BENCHMARK(BM_SerializeToolsList);

// ---- Framer ----

// Feeds a stream of N frames in fixed-size chunks, as reads from a pipe arrive.
static void BM_FramerChunkedStream(benchmark::State& state) {
    std::string stream;
    for (int i = 0; i < 256; ++i) stream += kToolCallRequest + "\n";
    const size_t chunk = static_cast<size_t>(state.range(0));

    for (auto _ : state) {
        LineFramer framer;
        size_t frames = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            frames += framer.feed(std::string_view(stream).substr(off, chunk)).size();
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FramerChunkedStream)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_FramerEncode(benchmark::State& state) {
    auto msg = Codec::parse(kToolCallRequest);
    for (auto _ : state) {
        auto s = LineFramer::encode(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FramerEncode);
