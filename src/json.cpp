#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

namespace {

// 2^63: the first double past the int64 range.
constexpr auto int64_limit = 9223372036854775808.0;

auto number_to_json(double d) -> nlohmann::json {
    if (std::isfinite(d) && d == std::trunc(d) && d >= -int64_limit && d < int64_limit) {
        return static_cast<std::int64_t>(d);
    }
    return d;
}

}  // anonymous namespace

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) { j = number_to_json(d); },
        [&](const std::string& s) { j = s; },
        [&](const Object& o) {
            j = nlohmann::json::object();
            for (const auto& [key, child] : o) {
                to_json(j[key], child);
            }
        },
        [&](const Array& a) {
            j = nlohmann::json::array();
            for (const auto& child : a) {
                auto child_j = nlohmann::json{};
                to_json(child_j, child);
                j.push_back(std::move(child_j));
            }
        },
    }, v.inner);
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{};
            return;
        case nlohmann::json::value_t::boolean:
            v = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            v = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            v = j.get<std::string>();
            return;
        case nlohmann::json::value_t::object: {
            auto object = Object{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                auto child = Value{};
                from_json(it.value(), child);
                object.emplace(it.key(), std::move(child));
            }
            v = std::move(object);
            return;
        }
        case nlohmann::json::value_t::array: {
            auto array = Array{};
            array.reserve(j.size());
            for (const auto& element : j) {
                auto child = Value{};
                from_json(element, child);
                array.push_back(std::move(child));
            }
            v = std::move(array);
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw Exception{ErrorKind::invalid_document,
                    std::string{"cannot convert JSON of type '"} + j.type_name() + "' to a value"};
}

void to_json(nlohmann::json& j, const Operation& op) {
    // Object keys are sorted on output: "op", "path", "value".
    j = nlohmann::json::object();
    j["op"] = std::string{to_string_view(op.op)};
    j["path"] = op.path;
    if (op.value) {
        to_json(j["value"], *op.value);
    } else if (op.op != OpType::remove) {
        j["value"] = nullptr;
    }
}

// =============================================================================
// Decoding
// =============================================================================

auto parse_document(std::string_view text) -> Value {
    auto j = nlohmann::json{};
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw Exception{ErrorKind::invalid_document, e.what()};
    }
    auto v = Value{};
    from_json(j, v);
    return v;
}

// =============================================================================
// Patch generation and serialization
// =============================================================================

auto create_patch(const nlohmann::json& source, const nlohmann::json& target,
                  const DiffOptions& options) -> Patch {
    auto a = Value{};
    auto b = Value{};
    from_json(source, a);
    from_json(target, b);
    return create_patch(a, b, options);
}

auto create_patch_from_text(std::string_view source, std::string_view target,
                            const DiffOptions& options) -> Patch {
    auto a = parse_document(source);
    auto b = parse_document(target);
    return create_patch(a, b, options);
}

auto patch_to_json(const Patch& patch) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& op : patch) {
        auto op_j = nlohmann::json{};
        to_json(op_j, op);
        j.push_back(std::move(op_j));
    }
    return j;
}

auto serialize_patch(const Patch& patch) -> std::string {
    try {
        return patch_to_json(patch).dump();
    } catch (const nlohmann::json::type_error& e) {
        throw Exception{ErrorKind::encoding_error, e.what()};
    }
}

}  // namespace jsonpatch_cpp
