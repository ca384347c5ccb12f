#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace crlf {

// Match a glob pattern against a relative path. Backslashes in either
// argument are treated as '/'.
// Supports: * (any chars except /), ** (any chars including /).
// "**/" also matches zero directories, so "a/**/b" matches "a/b".
// Never fails: an allocation failure while matching yields false.
bool glob_match(const std::string& pattern, const std::string& path);

// Index of the first pattern in `patterns` that matches `path`.
std::optional<size_t> glob_first_match(
    const std::vector<std::string>& patterns,
    const std::string& path);

} // namespace crlf
