#include <benchmark/benchmark.h>
#include "mcphost/pending_requests.hpp"
#include "mcphost/router.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcphost;

// ---- Correlation table ----

static void BM_RegisterAndComplete(benchmark::State& state) {
    PendingRequests pending;
    for (auto _ : state) {
        auto ticket = pending.register_request("tools/call");
        pending.complete(RequestId{ticket.id}, make_result_response(RequestId{ticket.id}, nlohmann::json::object()));
        auto resp = ticket.response.get();
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RegisterAndComplete);

// Completion with N other requests outstanding.
static void BM_CompleteWithOutstanding(benchmark::State& state) {
    PendingRequests pending;
    std::vector<PendingRequests::Ticket> outstanding;
    for (int64_t i = 0; i < state.range(0); ++i) outstanding.push_back(pending.register_request("ping"));

    for (auto _ : state) {
        auto ticket = pending.register_request("tools/call");
        pending.complete(RequestId{ticket.id}, make_result_response(RequestId{ticket.id}, nlohmann::json::object()));
        auto resp = ticket.response.get();
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_CompleteWithOutstanding)->Arg(10)->Arg(1000);

static void BM_UnmatchedResponse(benchmark::State& state) {
    PendingRequests pending;
    auto resp = make_result_response(RequestId{int64_t{999999}}, nlohmann::json::object());
    for (auto _ : state) {
        benchmark::DoNotOptimize(pending.complete(resp.id, resp));
    }
}
BENCHMARK(BM_UnmatchedResponse);

// ---- Server-initiated requests ----

static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult { return nlohmann::json::object(); });
    }
    router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static void BM_DispatchPing(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";
    JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = router->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing)->Arg(1)->Arg(100);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "sampling/createMessage";
    JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = router->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);
