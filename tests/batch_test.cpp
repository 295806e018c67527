#include <jsonpatch-cpp/jsonpatch.hpp>

#include "../src/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

auto make_pairs(std::size_t count) -> std::vector<DocumentPair> {
    auto pairs = std::vector<DocumentPair>{};
    pairs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto items = Array{};
        for (std::size_t k = 0; k <= i % 7; ++k) items.emplace_back(static_cast<int>(k));
        auto shifted = Array{};
        for (std::size_t k = 1; k <= i % 5 + 1; ++k) shifted.emplace_back(static_cast<int>(k));

        pairs.push_back(DocumentPair{
            .source = Value{Object{{"id", static_cast<int>(i)}, {"items", items}}},
            .target = Value{Object{{"id", static_cast<int>(i + 1)}, {"items", shifted},
                                   {"tag", "t" + std::to_string(i)}}},
        });
    }
    return pairs;
}

}  // namespace

// -- create_patches -----------------------------------------------------------

TEST(CreatePatches, empty_input) {
    const auto pairs = std::vector<DocumentPair>{};
    EXPECT_TRUE(create_patches(pairs).empty());
}

TEST(CreatePatches, matches_sequential_results_in_order) {
    const auto pairs = make_pairs(64);
    const auto batch = create_patches(pairs, 4);

    ASSERT_EQ(batch.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(batch[i], create_patch(pairs[i].source, pairs[i].target)) << "pair " << i;
    }
}

TEST(CreatePatches, single_thread_runs_inline) {
    const auto pairs = make_pairs(8);
    const auto batch = create_patches(pairs, 1);

    ASSERT_EQ(batch.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(batch[i], create_patch(pairs[i].source, pairs[i].target));
    }
}

TEST(CreatePatches, zero_threads_uses_hardware_concurrency) {
    const auto pairs = make_pairs(16);
    EXPECT_EQ(create_patches(pairs, 0), create_patches(pairs, 1));
}

TEST(CreatePatches, more_threads_than_pairs) {
    const auto pairs = make_pairs(3);
    EXPECT_EQ(create_patches(pairs, 32), create_patches(pairs, 1));
}

TEST(CreatePatches, options_apply_to_every_pair) {
    const auto a1 = Value{Object{{"a", 1}}};
    const auto a2 = Value{Object{{"a", 2}}};
    const auto b = Value{Object{{"b", Array{1}}}};
    const auto pairs = std::vector<DocumentPair>{
        {.source = Value{Array{a1, b}}, .target = Value{Array{a2, a1, b}}},
        {.source = Value{Array{a1, b}}, .target = Value{Array{a2, a1, b}}},
    };

    auto legacy = DiffOptions{};
    legacy.classification = ArrayClassification::first_object_decides;
    const auto batch = create_patches(pairs, 2, legacy);

    ASSERT_EQ(batch.size(), 2u);
    for (const auto& patch : batch) {
        EXPECT_EQ(patch, (Patch{make_add("/0", a2)}));
    }
}

// -- ThreadPool ---------------------------------------------------------------

TEST(ThreadPool, parallel_for_visits_every_index_once) {
    auto pool = detail::ThreadPool{4};
    auto hits = std::vector<std::atomic<int>>(100);
    pool.parallel_for(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });

    for (const auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(ThreadPool, parallel_for_with_zero_items) {
    auto pool = detail::ThreadPool{2};
    auto calls = std::atomic<int>{0};
    pool.parallel_for(0, [&](std::size_t) { calls.fetch_add(1); });
    EXPECT_EQ(calls.load(), 0);
}

TEST(ThreadPool, lowest_failing_index_is_rethrown) {
    auto pool = detail::ThreadPool{4};
    try {
        pool.parallel_for(50, [](std::size_t i) {
            if (i == 7 || i == 31) throw std::runtime_error{std::to_string(i)};
        });
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "7");
    }
}

TEST(ThreadPool, zero_threads_is_clamped_to_one) {
    auto pool = detail::ThreadPool{0};
    EXPECT_EQ(pool.size(), 1u);
}
