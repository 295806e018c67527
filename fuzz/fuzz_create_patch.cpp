// Fuzz target for create_patch_from_text() — the input is split at the first
// NUL byte into a source and a target document. When both parse, the patch
// is serialized and applied with nlohmann's RFC 6902 implementation; the
// result must equal the target.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    const auto a = input.substr(0, split);
    const auto b = input.substr(split + 1);

    auto source = jsonpatch_cpp::Value{};
    auto target = jsonpatch_cpp::Value{};
    try {
        source = jsonpatch_cpp::parse_document(a);
        target = jsonpatch_cpp::parse_document(b);
    } catch (const jsonpatch_cpp::Exception&) {
        return 0;  // not JSON
    }

    const auto patch = jsonpatch_cpp::create_patch(source, target);
    const auto text = jsonpatch_cpp::serialize_patch(patch);

    auto applied = nlohmann::json{};
    jsonpatch_cpp::to_json(applied, source);
    applied = applied.patch(nlohmann::json::parse(text));

    if (jsonpatch_cpp::parse_document(applied.dump()) != target) __builtin_trap();
    return 0;
}
