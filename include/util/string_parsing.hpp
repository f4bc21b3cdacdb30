// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of untrusted strings (RPC params, command-line options) into
 numeric values. Every parser requires the whole input to be consumed and
 returns std::nullopt on any error instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace blockledger {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("4294967296", 1, INT64_MAX) -> 4294967296
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * Parse a transaction amount
 *
 * Accepts decimal notation ("10", "0.25", "-3"); rejects empty input,
 * trailing characters, NaN and infinities.
 */
std::optional<double> SafeParseAmount(const std::string &str);

/**
 * Escape special characters in string for JSON output
 * Escapes: " \ \b \f \n \r \t and other control characters
 */
std::string EscapeJSONString(const std::string &str);

/**
 * JSON error response: JsonError("Invalid parameter") ->
 * "{\"error\":\"Invalid parameter\"}\n"
 */
std::string JsonError(const std::string &message);

} // namespace util
} // namespace blockledger
