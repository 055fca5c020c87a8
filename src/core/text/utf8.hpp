#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace runner::core::text {

// Number of Unicode code points in a UTF-8 string. Stray continuation bytes
// are not counted, so the input is expected to be valid UTF-8.
std::size_t count_chars(std::string_view utf8);

// Replaces each maximal ill-formed subpart with one U+FFFD, so a multi-byte
// character cut short costs a single replacement. Valid input is returned
// unchanged.
std::string sanitize_utf8(std::string_view bytes);

// Keeps the first `limit` code points and appends `marker` when anything was
// cut. Text at or below the limit is returned as is.
std::string truncate_chars(const std::string& utf8, std::size_t limit,
                           std::string_view marker);

}  // namespace runner::core::text
