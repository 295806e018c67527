/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for the core types and the diff engine:
/// Value, Operation, Patch, DiffOptions, create_patch, make_path and Error.
/// nlohmann/json interop lives separately in <jsonpatch-cpp/json.hpp>.

#pragma once

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>
