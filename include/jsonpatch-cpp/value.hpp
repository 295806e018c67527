/// @file value.hpp
/// @brief The JSON value model: Null, Kind, Object, Array and Value.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

struct Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A string-keyed mapping. Key order carries no meaning.
using Object = std::map<std::string, Value, std::less<>>;

/// The six kinds of JSON value, in the order of Value::Storage.
enum class Kind : std::uint8_t {
    null,     ///< The null literal.
    boolean,  ///< true or false.
    number,   ///< Any JSON number, held as a double.
    string,   ///< A UTF-8 string.
    object,   ///< A string-keyed mapping.
    array,    ///< An ordered sequence.
};

/// Convert a Kind to its string representation.
constexpr auto to_string_view(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::null:    return "null";
        case Kind::boolean: return "boolean";
        case Kind::number:  return "number";
        case Kind::string:  return "string";
        case Kind::object:  return "object";
        case Kind::array:   return "array";
    }
    return "unknown";
}

/// A decoded JSON value.
///
/// A closed variant over exactly six kinds. All numbers share one numeric
/// kind, so `1` and `1.0` are the same value.
///
/// @code
/// auto doc = Value{Object{
///     {"name", "web"},
///     {"ports", Array{80, 443}},
///     {"debug", false},
/// }};
/// @endcode
struct Value {
    using Storage = std::variant<Null, bool, double, std::string, Object, Array>;

    Storage inner;

    Value() = default;
    Value(Null) {}
    Value(bool b) : inner{b} {}
    Value(int i) : inner{static_cast<double>(i)} {}
    Value(std::int64_t i) : inner{static_cast<double>(i)} {}
    Value(double d) : inner{d} {}
    Value(const char* s) : inner{std::string{s}} {}
    Value(std::string s) : inner{std::move(s)} {}
    Value(std::string_view s) : inner{std::string{s}} {}
    Value(Object o) : inner{std::move(o)} {}
    Value(Array a) : inner{std::move(a)} {}

    /// The kind of the held alternative.
    auto kind() const noexcept -> Kind { return static_cast<Kind>(inner.index()); }

    auto is_null() const noexcept -> bool { return kind() == Kind::null; }
    auto is_object() const noexcept -> bool { return kind() == Kind::object; }
    auto is_array() const noexcept -> bool { return kind() == Kind::array; }

    /// True for strings, numbers and booleans. Null is not a scalar.
    auto is_scalar() const noexcept -> bool {
        auto k = kind();
        return k == Kind::boolean || k == Kind::number || k == Kind::string;
    }

    /// Typed access; returns nullptr on kind mismatch.
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&inner); }

    /// Deep structural equality (see equals()).
    friend auto operator==(const Value& a, const Value& b) -> bool;
};

/// Deep structural equality.
///
/// Values of different kinds are never equal. Objects are equal when they
/// hold the same key set with pairwise equal values; arrays when they have
/// the same length and pairwise equal elements.
auto equals(const Value& a, const Value& b) -> bool;

/// True when every value of the object is a scalar or null.
auto is_flat_object(const Object& object) -> bool;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](double d) { std::printf("%g\n", d); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.inner);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
