// docupdate-cpp benchmarks — measures throughput of path resolution and
// update application.

#include <docupdate-cpp/docupdate.hpp>
#include <docupdate-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace docupdate_cpp;

static auto make_wide_doc(std::int64_t fields) -> Value {
    auto doc = Document{};
    for (std::int64_t i = 0; i < fields; ++i) {
        doc.set("field" + std::to_string(i), static_cast<std::int32_t>(i));
    }
    return Value{std::move(doc)};
}

static auto make_deep_doc(std::int64_t depth) -> Value {
    auto v = Value{std::int32_t{0}};
    for (std::int64_t i = 0; i < depth; ++i) {
        v = Value{Document{{"a", std::move(v)}}};
    }
    return v;
}

static auto deep_path(std::int64_t depth) -> std::string {
    auto path = std::string{"a"};
    for (std::int64_t i = 1; i < depth; ++i) path += ".a";
    return path;
}

// =============================================================================
// Path parsing and resolution
// =============================================================================

static void bm_field_path_parse(benchmark::State& state) {
    const auto text = deep_path(state.range(0));
    for (auto _ : state) {
        auto path = FieldPath{text};
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_field_path_parse)->Range(1, 64);

static void bm_find_deep(benchmark::State& state) {
    const auto doc = make_deep_doc(state.range(0));
    const auto path = FieldPath{deep_path(state.range(0))};
    for (auto _ : state) {
        auto* v = find(doc, path);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_find_deep)->Range(1, 64);

static void bm_find_wide(benchmark::State& state) {
    const auto doc = make_wide_doc(state.range(0));
    const auto path = FieldPath{"field" + std::to_string(state.range(0) - 1)};
    for (auto _ : state) {
        auto* v = find(doc, path);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_find_wide)->Range(8, 1024);

// =============================================================================
// Update application
// =============================================================================

static void bm_apply_set(benchmark::State& state) {
    const auto applier = UpdateApplier{};
    auto doc = make_wide_doc(100);
    std::int32_t i = 0;
    for (auto _ : state) {
        auto result = applier.apply(doc, {{"$set", "field50", i++}});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_set);

static void bm_apply_set_unchanged(benchmark::State& state) {
    const auto applier = UpdateApplier{};
    auto doc = make_deep_doc(16);
    const auto spec = UpdateSpec{{"$set", deep_path(16), std::int32_t{0}}};
    for (auto _ : state) {
        auto result = applier.apply(doc, spec);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_set_unchanged);

static void bm_apply_push_pop(benchmark::State& state) {
    const auto applier = UpdateApplier{};
    auto doc = Value{Document{{"v", Array{}}}};
    const auto push = UpdateSpec{{"$push", "v", std::int32_t{1}}};
    const auto pop = UpdateSpec{{"$pop", "v", std::int32_t{-1}}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(applier.apply(doc, push));
        benchmark::DoNotOptimize(applier.apply(doc, pop));
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_apply_push_pop);

static void bm_apply_many_modifications(benchmark::State& state) {
    const auto n = state.range(0);
    const auto applier = UpdateApplier{};
    auto spec = UpdateSpec{};
    for (std::int64_t i = 0; i < n; ++i) {
        spec.push_back({"$inc", "field" + std::to_string(i), std::int32_t{1}});
    }
    auto doc = make_wide_doc(n);
    for (auto _ : state) {
        auto result = applier.apply(doc, spec);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_many_modifications)->Range(8, 256);

// =============================================================================
// JSON
// =============================================================================

static void bm_parse_and_apply_json(benchmark::State& state) {
    const auto applier = UpdateApplier{};
    const auto update = nlohmann::ordered_json::parse(
        R"({"$set": {"v.foo": 1, "v.array.0": "x"}, "$pop": {"v.list": 1}})");
    for (auto _ : state) {
        auto doc = nlohmann::ordered_json::parse(
            R"({"_id": 1, "v": {"foo": 42, "array": [42, "foo"], "list": [1, 2, 3]}})")
            .get<Value>();
        auto result = apply_update(applier, doc, update);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_and_apply_json);
