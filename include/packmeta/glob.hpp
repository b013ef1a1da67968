#pragma once

#include <string>

namespace packmeta {

// Match a relative directory pattern from [workspace] members/exclude
// against a relative path. Both sides use '/' separators ('\' is accepted).
//   *     any run of characters within one path segment
//   ?     one character within a segment
//   [..]  character class, [!..] negated, ranges like [a-z]
//   **    zero or more whole segments
bool glob_match(const std::string& pattern, const std::string& path);

} // namespace packmeta
