/// @file operation.hpp
/// @brief Patch operation types: OpType, Operation and Patch.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    add,      ///< Insert into an array or create an object member.
    remove,   ///< Delete an array element or object member.
    replace,  ///< Overwrite the value at a path.
};

/// Convert an OpType to its RFC 6902 "op" string.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
    }
    return "unknown";
}

/// A single RFC 6902 operation.
///
/// `value` holds the new value for add and replace (an explicit Null is a
/// value, not an absence) and is empty for remove.
struct Operation {
    OpType op;                         ///< The mutation to perform.
    std::string path;                  ///< RFC 6901 pointer to the target location.
    std::optional<Value> value{};      ///< The value to write; absent for remove.

    auto operator==(const Operation&) const -> bool = default;
};

/// An ordered sequence of operations, applied front to back.
using Patch = std::vector<Operation>;

/// Construct an add operation.
inline auto make_add(std::string path, Value value) -> Operation {
    return Operation{.op = OpType::add, .path = std::move(path), .value = std::move(value)};
}

/// Construct a remove operation.
inline auto make_remove(std::string path) -> Operation {
    return Operation{.op = OpType::remove, .path = std::move(path), .value = std::nullopt};
}

/// Construct a replace operation.
inline auto make_replace(std::string path, Value value) -> Operation {
    return Operation{.op = OpType::replace, .path = std::move(path), .value = std::move(value)};
}

/// Stable-sort a patch by path string.
///
/// Changes the application order, so a sorted patch is meant for display and
/// comparison, not for applying.
void sort_by_path(Patch& patch);

}  // namespace jsonpatch_cpp
