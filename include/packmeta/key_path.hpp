#pragma once

#include <packmeta/result.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace packmeta {

// Ordered sequence of segments addressing a nested location in a Value.
// A segment is a table key, or an array index when the node it is applied
// to turns out to be an array.
class KeyPath {
public:
    KeyPath() = default;
    KeyPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}
    KeyPath(std::initializer_list<std::string> segments) : segments_(segments) {}

    // Dotted TOML key syntax: bare segments [A-Za-z0-9_-]+, "basic" quoted
    // segments with escapes, 'literal' quoted segments. Whitespace around
    // segments is ignored. Empty input is the empty path.
    static Result<KeyPath> parse(std::string_view text);

    const std::vector<std::string>& segments() const { return segments_; }
    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }

    std::vector<std::string>::const_iterator begin() const { return segments_.begin(); }
    std::vector<std::string>::const_iterator end() const { return segments_.end(); }

    KeyPath child(std::string segment) const;

    // Dotted form that parses back to the same segments
    std::string to_string() const;

    bool operator==(const KeyPath& other) const { return segments_ == other.segments_; }
    bool operator!=(const KeyPath& other) const { return segments_ != other.segments_; }

private:
    std::vector<std::string> segments_;
};

bool is_bare_key(std::string_view key);

// Bare keys unchanged, anything else as a quoted basic string
std::string format_key(const std::string& key);

// TOML basic string literal with escapes
std::string quote_string(const std::string& s);

} // namespace packmeta
