// jsonpatch-cpp benchmarks — measures throughput of patch generation.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

auto make_record(int id, int version) -> Value {
    return Value{Object{
        {"id", id},
        {"name", "record-" + std::to_string(id)},
        {"version", version},
        {"active", version % 2 == 0},
        {"labels", Object{{"tier", version > 1 ? "edge" : "core"}, {"app", "bench"}}},
    }};
}

auto make_document(int records, int version) -> Value {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(records));
    for (int i = 0; i < records; ++i) {
        items.push_back(make_record(i, i % 10 == 0 ? version : 1));
    }
    return Value{Object{{"kind", "List"}, {"items", std::move(items)}}};
}

auto make_scalar_array(int count, int offset) -> Value {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) items.emplace_back(i + offset);
    return Value{std::move(items)};
}

}  // namespace

// =============================================================================
// Objects
// =============================================================================

static void bm_identical_documents(benchmark::State& state) {
    const auto doc = make_document(static_cast<int>(state.range(0)), 1);
    for (auto _ : state) {
        auto patch = create_patch(doc, doc);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_identical_documents)->Range(8, 512);

static void bm_flat_object_replace(benchmark::State& state) {
    auto a = Object{};
    auto b = Object{};
    for (int i = 0; i < 100; ++i) {
        a.emplace("key" + std::to_string(i), i);
        b.emplace("key" + std::to_string(i), i % 3 == 0 ? i + 1 : i);
    }
    const auto source = Value{std::move(a)};
    const auto target = Value{std::move(b)};

    for (auto _ : state) {
        auto patch = create_patch(source, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_flat_object_replace);

// =============================================================================
// Arrays
// =============================================================================

static void bm_simple_array_shift(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto source = make_scalar_array(n, 0);
    const auto target = make_scalar_array(n, 1);

    for (auto _ : state) {
        auto patch = create_patch(source, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_simple_array_shift)->Range(16, 1024);

static void bm_positional_array(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto source = make_document(n, 1);
    const auto target = make_document(n, 2);

    for (auto _ : state) {
        auto patch = create_patch(source, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_positional_array)->Range(16, 1024);

// =============================================================================
// Text interface
// =============================================================================

static void bm_text_round_trip(benchmark::State& state) {
    auto source = nlohmann::json{};
    auto target = nlohmann::json{};
    to_json(source, make_document(64, 1));
    to_json(target, make_document(64, 2));
    const auto a = source.dump();
    const auto b = target.dump();

    for (auto _ : state) {
        auto text = serialize_patch(create_patch_from_text(a, b));
        benchmark::DoNotOptimize(text);
        state.SetBytesProcessed(static_cast<std::int64_t>(a.size() + b.size()));
    }
}
BENCHMARK(bm_text_round_trip);

// =============================================================================
// Batch diffing — 500 pairs, sequential vs parallel
//
// Arg: 0 = one thread, 1 = hardware_concurrency().
// =============================================================================

static void bm_create_patches(benchmark::State& state) {
    const bool parallel = state.range(0) != 0;
    constexpr int pair_count = 500;

    auto pairs = std::vector<DocumentPair>{};
    pairs.reserve(pair_count);
    for (int i = 0; i < pair_count; ++i) {
        pairs.push_back(DocumentPair{.source = make_document(20, i), .target = make_document(20, i + 1)});
    }

    for (auto _ : state) {
        auto patches = create_patches(pairs, parallel ? 0u : 1u);
        benchmark::DoNotOptimize(patches);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * pair_count);
    state.SetLabel(parallel ? "parallel" : "sequential");
}
BENCHMARK(bm_create_patches)->Arg(0)->Arg(1);
