#pragma once

#include <packmeta/decode.hpp>
#include <optional>
#include <string>
#include <vector>

namespace packmeta {

// [package.metadata.pack]
//   files = ["README.md"]          # shipped alongside the build outputs
//   default-packers = ["docker"]   # reserved
struct PackConfig {
    std::optional<std::vector<std::string>> files;
    std::optional<std::vector<std::string>> default_packers;

    std::string to_string() const;

    bool operator==(const PackConfig& other) const {
        return files == other.files && default_packers == other.default_packers;
    }
    bool operator!=(const PackConfig& other) const { return !(*this == other); }
};

template<>
struct Decoder<PackConfig> {
    static std::string expected() { return "table"; }
    static Result<PackConfig> decode(const Value& v, const std::string& at);
};

} // namespace packmeta
