#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mergington {
namespace url {

/**
 * Decode %XX escapes. When form is true, '+' also decodes to a space
 * (query-string rules). Malformed escapes are kept literally.
 */
std::string percent_decode(const std::string& text, bool form = false);

/// True when text is well-formed UTF-8 (no overlongs, surrogates or code points past U+10FFFF).
bool is_valid_utf8(const std::string& text);

/// Split a request target into its path and query parts.
std::pair<std::string, std::string> split_target(const std::string& target);

/// Split a path on '/' and decode each segment. Empty segments are dropped.
std::vector<std::string> path_segments(const std::string& path);

/// Parse a query string. On repeated keys the last value wins.
std::map<std::string, std::string> parse_query(const std::string& query);

/**
 * Resolve a relative path below root, refusing any ".." that would
 * escape it. Returns nothing for an escaping path.
 */
std::optional<std::string> safe_join(const std::string& root, const std::vector<std::string>& segments);

} // namespace url
} // namespace mergington
