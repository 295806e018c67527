// basic_usage — demonstrates the core jsonpatch-cpp API
//
// Shows building documents with Object{}/Array{} initializer lists, diffing
// them, inspecting operations, sorting by path, serializing to RFC 6902
// text, and diffing a batch of pairs concurrently.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;

static void print_patch(const char* title, const jp::Patch& patch) {
    std::printf("%s (%zu ops):\n", title, patch.size());
    for (const auto& op : patch) {
        auto value = std::string{"-"};
        if (op.value) value = nlohmann::json(*op.value).dump();
        std::printf("  %-7s %-28s %s\n", std::string{jp::to_string_view(op.op)}.c_str(),
                    op.path.c_str(), value.c_str());
    }
}

int main() {
    // -- Build two versions of a document -------------------------------------
    const auto before = jp::Value{jp::Object{
        {"name", "frontend"},
        {"replicas", 2},
        {"labels", jp::Object{{"app", "web"}, {"tier", "frontend"}}},
        {"ports", jp::Array{80, 443}},
        {"debug", true},
    }};
    const auto after = jp::Value{jp::Object{
        {"name", "frontend"},
        {"replicas", 3},
        {"labels", jp::Object{{"app", "web"}, {"tier", "edge"}, {"team/owner", "infra"}}},
        {"ports", jp::Array{443, 8443}},
    }};

    // -- Diff -----------------------------------------------------------------
    auto patch = jp::create_patch(before, after);
    print_patch("Patch", patch);

    // -- Sorted view for stable display ---------------------------------------
    jp::sort_by_path(patch);
    print_patch("Sorted by path", patch);

    // -- RFC 6902 text --------------------------------------------------------
    std::printf("JSON: %s\n", jp::serialize_patch(patch).c_str());

    // -- Identical documents produce an empty patch ---------------------------
    std::printf("Identical: %zu ops\n", jp::create_patch(after, after).size());

    // -- Pointer helpers ------------------------------------------------------
    std::printf("Pointer: %s\n", jp::make_path("/labels", "team/owner").c_str());

    // -- Batch diffing --------------------------------------------------------
    auto pairs = std::vector<jp::DocumentPair>{};
    for (int i = 0; i < 4; ++i) {
        pairs.push_back({.source = jp::Value{jp::Object{{"n", i}}},
                         .target = jp::Value{jp::Object{{"n", i * 2}}}});
    }
    const auto patches = jp::create_patches(pairs, 2);
    for (std::size_t i = 0; i < patches.size(); ++i) {
        std::printf("Pair %zu: %s\n", i, jp::serialize_patch(patches[i]).c_str());
    }

    return 0;
}
