// json_diff — print the JSON Patch that turns one JSON file into another
//
// Usage: json_diff <source.json> <target.json> [--legacy-arrays] [--sort]
//
//   --legacy-arrays  classify arrays by their first object element only
//   --sort           order operations by path (the result may no longer
//                    apply cleanly; for display only)
//
// Exit status: 0 on success, 1 on usage error, 2 on unreadable or invalid
// input.
//
// Build: cmake --build build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_diff old.json new.json

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace jp = jsonpatch_cpp;

static auto read_file(const char* path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return buffer.str();
}

static void print_usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s <source.json> <target.json> [--legacy-arrays] [--sort]\n", argv0);
}

int main(int argc, char** argv) {
    const char* files[2] = {nullptr, nullptr};
    auto file_count = 0;
    auto options = jp::DiffOptions{};
    auto sort = false;

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--legacy-arrays") {
            options.classification = jp::ArrayClassification::first_object_decides;
        } else if (arg == "--sort") {
            sort = true;
        } else if (arg.starts_with("--") || file_count == 2) {
            print_usage(argv[0]);
            return 1;
        } else {
            files[file_count++] = argv[i];
        }
    }
    if (file_count != 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto source_text = read_file(files[0]);
    auto target_text = read_file(files[1]);
    if (!source_text || !target_text) {
        std::fprintf(stderr, "error: cannot read %s\n", source_text ? files[1] : files[0]);
        return 2;
    }

    try {
        auto patch = jp::create_patch_from_text(*source_text, *target_text, options);
        if (sort) jp::sort_by_path(patch);
        std::printf("%s\n", jp::serialize_patch(patch).c_str());
    } catch (const jp::Exception& e) {
        std::fprintf(stderr, "error: %s: %s\n",
                     std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
        return 2;
    }
    return 0;
}
