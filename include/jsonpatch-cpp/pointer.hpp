/// @file pointer.hpp
/// @brief RFC 6901 JSON Pointer construction.
///
/// Only encoding is provided: the diff builds pointers, it never resolves
/// them.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// Escape one reference token: `~` becomes `~0`, `/` becomes `~1`.
auto escape_segment(std::string_view segment) -> std::string;

/// Append the escaped form of `segment` to `out`.
void append_escaped(std::string& out, std::string_view segment);

/// Join an escaped segment onto a pointer prefix.
///
/// Exactly one `/` separates prefix and segment; none is added when the
/// prefix already ends with `/`. An empty prefix is the document root.
///
/// @code
/// make_path("", "a/b");        // "/a~1b"
/// make_path("/spec", "ports"); // "/spec/ports"
/// make_path("/x/", "y");       // "/x/y"
/// @endcode
auto make_path(std::string_view prefix, std::string_view segment) -> std::string;

/// Join an array index onto a pointer prefix, in plain decimal.
auto make_path(std::string_view prefix, std::size_t index) -> std::string;

}  // namespace jsonpatch_cpp
