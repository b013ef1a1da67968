#pragma once

#include <packmeta/log.hpp>
#include <packmeta/result.hpp>
#include <optional>
#include <string>

namespace packmeta {

// Tool settings, layered: built-in defaults < global file < environment.
// Unset fields defer to lower layers.
//
//   [log]
//   level = "debug"
//   color = false
//
//   [manifest]
//   name = "Package.toml"
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;
    std::optional<std::string> manifest_name;

    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");
    static Result<Config> load(const std::string& path);

    // PACKMETA_LOG and PACKMETA_MANIFEST
    static Result<Config> from_env();

    // Set fields of `other` override this
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& env);

    std::string manifest_file() const;

    // Push log_level/log_color into packmeta::log
    void apply_logging() const;
};

// ~/.packmeta/config.toml, or "" when no home directory is known
std::string global_config_path();

// Global file (when present) merged with the environment
Result<Config> load_effective_config();

} // namespace packmeta
