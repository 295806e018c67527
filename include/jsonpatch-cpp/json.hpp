/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonpatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value and Operation,
/// decoding of JSON text into Value, and serialization of a Patch into
/// RFC 6902 text.

#pragma once

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jsonpatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);

/// Numbers with an integral value that fits in int64 are written as
/// integers, all others as doubles.
void to_json(nlohmann::json& j, const Value& v);

/// @throws Exception (invalid_document) for binary or discarded values.
void from_json(const nlohmann::json& j, Value& v);

/// Writes {"op", "path", "value"}. The value key is omitted only for a
/// remove without a value; add/replace without a value write `null`.
void to_json(nlohmann::json& j, const Operation& op);

// =============================================================================
// Decoding
// =============================================================================

/// Parse JSON text into a Value.
/// @throws Exception (invalid_document) on malformed text.
auto parse_document(std::string_view text) -> Value;

// =============================================================================
// Patch generation and serialization
// =============================================================================

/// Diff two nlohmann::json documents.
/// @throws Exception (invalid_document) if either holds a binary value.
auto create_patch(const nlohmann::json& source, const nlohmann::json& target,
                  const DiffOptions& options = {}) -> Patch;

/// Diff two JSON texts.
/// @throws Exception (invalid_document) if either text is malformed.
auto create_patch_from_text(std::string_view source, std::string_view target,
                            const DiffOptions& options = {}) -> Patch;

/// Convert a patch to its JSON array form.
auto patch_to_json(const Patch& patch) -> nlohmann::json;

/// Serialize a patch to compact RFC 6902 text.
/// @throws Exception (encoding_error) if a value cannot be encoded.
auto serialize_patch(const Patch& patch) -> std::string;

}  // namespace jsonpatch_cpp
