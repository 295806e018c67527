/// @file diff.hpp
/// @brief Patch generation: create_patch, create_patches and DiffOptions.

#pragma once

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// How the array differ decides whether an array is "simple", i.e. safe
/// for edit-distance diffing.
enum class ArrayClassification : std::uint8_t {
    /// Every element must be a scalar or a flat object.
    inspect_all,
    /// Scan in order; the first object element alone decides. Reproduces
    /// the patches of the reference generator bit for bit.
    first_object_decides,
};

/// Convert an ArrayClassification to its string representation.
constexpr auto to_string_view(ArrayClassification policy) noexcept -> std::string_view {
    switch (policy) {
        case ArrayClassification::inspect_all:          return "inspect_all";
        case ArrayClassification::first_object_decides: return "first_object_decides";
    }
    return "unknown";
}

/// Per-call diff configuration.
struct DiffOptions {
    ArrayClassification classification{ArrayClassification::inspect_all};

    auto operator==(const DiffOptions&) const -> bool = default;
};

/// A source/target pair for batch diffing.
struct DocumentPair {
    Value source;
    Value target;
};

/// Classify an array for the edit-distance path.
///
/// Null elements and nested arrays always make an array non-simple; an
/// empty array is simple.
auto is_simple_array(const Array& array,
                     ArrayClassification policy = ArrayClassification::inspect_all) -> bool;

/// Compute the patch that turns `source` into `target`.
///
/// Applying the result to `source` with any RFC 6902 applicator yields a
/// value equal to `target`. Identical inputs always produce the identical
/// operation sequence; `create_patch(a, a)` is empty.
///
/// @code
/// auto patch = create_patch(Value{Object{{"a", 1}}}, Value{Object{{"a", 2}}});
/// // patch == {replace "/a" 2}
/// @endcode
auto create_patch(const Value& source, const Value& target,
                  const DiffOptions& options = {}) -> Patch;

/// Diff many independent pairs concurrently.
///
/// Results are in input order and equal to calling create_patch() on each
/// pair. `num_threads`: 0 = hardware_concurrency(), 1 = the calling thread.
auto create_patches(std::span<const DocumentPair> pairs,
                    unsigned int num_threads = 0,
                    const DiffOptions& options = {}) -> std::vector<Patch>;

}  // namespace jsonpatch_cpp
