// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command-line values into bounded integers.
 - The whole input must be consumed (no trailing garbage, no leading space)
 - Out-of-range values are rejected, never clamped
 - Returns std::nullopt on any error (never throws)
*/

#include <cstdint>
#include <optional>
#include <string>

namespace devicelink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("64000", 1, INT64_MAX) -> 64000
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt (overflow)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

} // namespace util
} // namespace devicelink
