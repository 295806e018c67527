#include <jsonpatch-cpp/pointer.hpp>

#include <array>
#include <charconv>

namespace jsonpatch_cpp {

void append_escaped(std::string& out, std::string_view segment) {
    // Single pass; equivalent to replacing "~" before "/".
    for (char c : segment) {
        if (c == '~') { out += "~0"; }
        else if (c == '/') { out += "~1"; }
        else { out += c; }
    }
}

auto escape_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    append_escaped(result, segment);
    return result;
}

auto make_path(std::string_view prefix, std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(prefix.size() + segment.size() + 1);
    result += prefix;
    if (!prefix.ends_with('/')) {
        result += '/';
    }
    append_escaped(result, segment);
    return result;
}

auto make_path(std::string_view prefix, std::size_t index) -> std::string {
    auto digits = std::array<char, 24>{};
    auto res = std::to_chars(digits.data(), digits.data() + digits.size(), index);
    return make_path(prefix, std::string_view{digits.data(), static_cast<std::size_t>(res.ptr - digits.data())});
}

}  // namespace jsonpatch_cpp
