#include <jsonpatch-cpp/value.hpp>

#include <variant>

namespace jsonpatch_cpp {

auto equals(const Value& a, const Value& b) -> bool {
    if (a.kind() != b.kind()) return false;

    return std::visit(overload{
        [](Null) { return true; },
        [&](bool x) { return x == std::get<bool>(b.inner); },
        [&](double x) { return x == std::get<double>(b.inner); },
        [&](const std::string& x) { return x == std::get<std::string>(b.inner); },
        [&](const Object& x) {
            const auto& y = std::get<Object>(b.inner);
            if (x.size() != y.size()) return false;
            // Both maps are key-sorted, so equal key sets line up pairwise.
            auto it = y.begin();
            for (const auto& [key, value] : x) {
                if (key != it->first || !equals(value, it->second)) return false;
                ++it;
            }
            return true;
        },
        [&](const Array& x) {
            const auto& y = std::get<Array>(b.inner);
            if (x.size() != y.size()) return false;
            for (std::size_t i = 0; i < x.size(); ++i) {
                if (!equals(x[i], y[i])) return false;
            }
            return true;
        },
    }, a.inner);
}

auto operator==(const Value& a, const Value& b) -> bool {
    return equals(a, b);
}

auto is_flat_object(const Object& object) -> bool {
    for (const auto& [key, value] : object) {
        if (!value.is_null() && !value.is_scalar()) return false;
    }
    return true;
}

}  // namespace jsonpatch_cpp
