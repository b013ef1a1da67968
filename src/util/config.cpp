#include <packmeta/config.hpp>
#include <packmeta/decode.hpp>
#include <packmeta/manifest.hpp>
#include <packmeta/workspace.hpp>
#include <cstdlib>
#include <filesystem>

namespace packmeta {

static Result<log::Level> level_from_name(const std::string& name,
                                          const std::string& origin) {
    log::Level lvl;
    if (!log::parse_level(name, lvl)) {
        return PackError{PackError::Config,
            "unknown log level '" + name + "' in " + origin,
            "use one of: trace, debug, info, warn, error, off"};
    }
    return Result<log::Level>::ok(lvl);
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    std::string origin = source.empty() ? std::string("config") : source;

    auto doc = parse_manifest(toml_str, source);
    if (doc.is_err()) {
        PackError err = std::move(doc).error();
        err.code = PackError::Config;
        return err;
    }

    Config cfg;
    std::optional<std::string> level;

    const Table& root = *doc.value().as_table();
    if (const Value* logv = root.find("log")) {
        TableDecoder td(*logv, "log");
        td.optional("level", level).optional("color", cfg.log_color);
        auto st = td.finish();
        if (st.is_err()) {
            PackError err = std::move(st).error();
            err.code = PackError::Config;
            return err.at(origin);
        }
    }
    if (const Value* mv = root.find("manifest")) {
        TableDecoder td(*mv, "manifest");
        td.optional("name", cfg.manifest_name);
        auto st = td.finish();
        if (st.is_err()) {
            PackError err = std::move(st).error();
            err.code = PackError::Config;
            return err.at(origin);
        }
    }

    if (level) {
        auto lvl = level_from_name(*level, origin);
        if (lvl.is_err()) return std::move(lvl).error();
        cfg.log_level = lvl.value();
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    auto text = read_manifest(path);
    if (text.is_err()) {
        PackError err = std::move(text).error();
        err.code = PackError::Config;
        err.message = "cannot read config file: " + path;
        return err;
    }
    return Config::parse(text.value(), path);
}

Result<Config> Config::from_env() {
    Config cfg;
    if (const char* lvl = std::getenv("PACKMETA_LOG")) {
        auto parsed = level_from_name(lvl, "PACKMETA_LOG");
        if (parsed.is_err()) return std::move(parsed).error();
        cfg.log_level = parsed.value();
    }
    if (const char* nc = std::getenv("NO_COLOR")) {
        if (*nc) cfg.log_color = false;
    }
    if (const char* name = std::getenv("PACKMETA_MANIFEST")) {
        if (*name) cfg.manifest_name = std::string(name);
    }
    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.manifest_name) manifest_name = other.manifest_name;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

std::string Config::manifest_file() const {
    return manifest_name.value_or(kDefaultManifestName);
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.packmeta/config.toml";
}

Result<Config> load_effective_config() {
    std::optional<Config> global;
    std::string gpath = global_config_path();
    std::error_code ec;
    if (!gpath.empty() && std::filesystem::exists(gpath, ec)) {
        auto gc = Config::load(gpath);
        if (gc.is_err()) return std::move(gc).error();
        global = std::move(gc).value();
    }

    auto env = Config::from_env();
    if (env.is_err()) return std::move(env).error();

    return Result<Config>::ok(Config::effective(global, env.value()));
}

} // namespace packmeta
