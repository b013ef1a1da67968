#pragma once

#include <packmeta/result.hpp>
#include <packmeta/value.hpp>
#include <filesystem>
#include <string>

namespace packmeta {

// Raw manifest bytes; PackError::ManifestRead on any I/O failure
Result<std::string> read_manifest(const std::filesystem::path& path);

// Parse TOML text into a Value table. Parse failures come back as
// PackError::ManifestParse with the parser's description and position.
Result<Value> parse_manifest(const std::string& text,
                             const std::string& source_path = "");

// read_manifest + parse_manifest
Result<Value> load_manifest(const std::filesystem::path& path);

} // namespace packmeta
