#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace activities {
namespace url {

/**
 * Decode %XX escapes. Malformed escapes are kept verbatim.
 * With `plus_as_space`, '+' decodes to ' ' (form encoding, used for queries).
 */
std::string percent_decode(const std::string& encoded, bool plus_as_space = false);

/// Split a request target into its path and its raw query string.
std::pair<std::string, std::string> split_target(const std::string& target);

/// Split a path on '/', dropping empty segments, and decode each segment.
std::vector<std::string> path_segments(const std::string& path);

/// True when `text` is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF).
bool is_valid_utf8(const std::string& text);

/// Parse a query string into decoded key/value pairs. A repeated key keeps its last value.
std::map<std::string, std::string> parse_query(const std::string& query);

} // namespace url
} // namespace activities
