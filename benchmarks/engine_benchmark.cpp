// fieldpath-cpp benchmarks: measures throughput of core operations.

#include <fieldpath-cpp/fieldpath.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace fieldpath_cpp;

static auto make_orders(std::int64_t n) -> Json {
    auto orders = Json::array();
    for (std::int64_t i = 0; i < n; ++i) {
        orders.push_back(Json{
            {"id", i},
            {"total", static_cast<double>(i) * 1.5},
            {"customer", {{"name", "customer " + std::to_string(i)}, {"tier", i % 3 == 0 ? "gold" : "basic"}}},
            {"items", Json::array({"a", "b", "c"})},
        });
    }
    return Json{{"orders", orders}, {"meta", {{"version", 1}}}};
}

// =============================================================================
// Compiler
// =============================================================================

static void bm_compile_simple(benchmark::State& state) {
    for (auto _ : state) {
        auto expr = compile("$.user.profile.age");
        benchmark::DoNotOptimize(expr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compile_simple);

static void bm_compile_filter(benchmark::State& state) {
    for (auto _ : state) {
        auto expr = compile("$.orders[?(@.total >= 100.5)].customer['name']");
        benchmark::DoNotOptimize(expr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compile_filter);

static void bm_path_cache_hit(benchmark::State& state) {
    auto cache = PathCache{};
    cache.get("$.orders[*].customer.name");
    for (auto _ : state) {
        auto expr = cache.get("$.orders[*].customer.name");
        benchmark::DoNotOptimize(expr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_path_cache_hit);

// =============================================================================
// Evaluator
// =============================================================================

static void bm_evaluate_definite(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$.orders[-1].customer.name");
    for (auto _ : state) {
        auto matches = evaluate(expr, doc);
        benchmark::DoNotOptimize(matches);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_evaluate_definite)->Range(10, 10000);

static void bm_evaluate_wildcard(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$.orders[*].id");
    for (auto _ : state) {
        auto matches = evaluate(expr, doc);
        benchmark::DoNotOptimize(matches);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_evaluate_wildcard)->Range(10, 10000);

static void bm_evaluate_filter(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$.orders[?(@.total > 100)].id");
    for (auto _ : state) {
        auto matches = evaluate(expr, doc);
        benchmark::DoNotOptimize(matches);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_evaluate_filter)->Range(10, 10000);

static void bm_evaluate_recursive(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$..name");
    for (auto _ : state) {
        auto matches = evaluate(expr, doc);
        benchmark::DoNotOptimize(matches);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_evaluate_recursive)->Range(10, 10000);

// =============================================================================
// Mutation
// =============================================================================

static void bm_update_broadcast(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$.orders[*].customer.tier");
    for (auto _ : state) {
        auto result = apply_update(expr, doc, "platinum");
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_update_broadcast)->Range(10, 10000);

static void bm_update_synthesize(benchmark::State& state) {
    const auto expr = compile("$.a.b.c[3].d");
    for (auto _ : state) {
        auto result = apply_update(expr, Json::object(), 1);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_update_synthesize);

static void bm_delete_compact(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$.orders[?(@.total > 100)]");
    for (auto _ : state) {
        auto result = apply_delete(expr, doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_delete_compact)->Range(10, 10000);

static void bm_delete_recursive(benchmark::State& state) {
    const auto doc = make_orders(state.range(0));
    const auto expr = compile("$..items");
    for (auto _ : state) {
        auto result = apply_delete(expr, doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_delete_recursive)->Range(10, 10000);

// =============================================================================
// Engine round trip (decode, mutate, encode)
// =============================================================================

static void bm_record_update(benchmark::State& state) {
    auto rec = Record{};
    rec.set_field("json_payload", encode(make_orders(state.range(0))));
    std::int64_t i = 0;
    for (auto _ : state) {
        auto result = rec.update_path("$.meta.version", i++);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_record_update)->Range(10, 1000);

static void bm_record_resolve(benchmark::State& state) {
    auto rec = Record{};
    rec.set_field("json_payload", encode(make_orders(state.range(0))));
    for (auto _ : state) {
        auto result = rec.resolve_path("$.orders[*].customer.name");
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_record_resolve)->Range(10, 1000);

