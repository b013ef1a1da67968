#pragma once

#include <packmeta/key_path.hpp>
#include <packmeta/value.hpp>
#include <optional>
#include <string>

namespace packmeta {

// Walk `tree` along `path`, moving each visited child out of its parent.
// Tables are indexed by key, arrays by base-10 index; a missing key, an
// out-of-range or non-numeric index, or a scalar with segments left yields
// std::nullopt. The empty path returns the tree itself.
std::optional<Value> lookup(Value tree, const KeyPath& path);

// Strict non-negative base-10 integer: digits only, no sign, no overflow
bool parse_index(const std::string& segment, size_t& out);

} // namespace packmeta
