#include <packmeta/manifest.hpp>
#include <packmeta/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace packmeta {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// toml++ node -> Value
// ---------------------------------------------------------------------------

static Datetime::Date convert_date(const toml::date& d) {
    Datetime::Date out;
    out.year = d.year;
    out.month = d.month;
    out.day = d.day;
    return out;
}

static Datetime::Time convert_time(const toml::time& t) {
    Datetime::Time out;
    out.hour = t.hour;
    out.minute = t.minute;
    out.second = t.second;
    out.nanosecond = static_cast<int>(t.nanosecond);
    return out;
}

static Value convert_node(const toml::node& node);

static Table convert_table(const toml::table& tbl) {
    Table out;
    for (const auto& [key, val] : tbl) {
        out.insert_or_assign(std::string(key.str()), convert_node(val));
    }
    return out;
}

static Value convert_node(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        return Value(convert_table(*tbl));
    }
    if (auto arr = node.as_array()) {
        Array out;
        out.reserve(arr->size());
        for (const auto& elem : *arr) {
            out.push_back(convert_node(elem));
        }
        return Value(std::move(out));
    }
    if (auto s = node.as_string()) return Value(s->get());
    if (auto i = node.as_integer()) return Value(i->get());
    if (auto f = node.as_floating_point()) return Value(f->get());
    if (auto b = node.as_boolean()) return Value(b->get());

    Datetime dt;
    if (auto d = node.as_date()) {
        dt.date = convert_date(d->get());
    } else if (auto t = node.as_time()) {
        dt.time = convert_time(t->get());
    } else if (auto ddt = node.as_date_time()) {
        const toml::date_time& v = ddt->get();
        dt.date = convert_date(v.date);
        dt.time = convert_time(v.time);
        if (v.offset) dt.offset_minutes = v.offset->minutes;
    }
    return Value(std::move(dt));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::string> read_manifest(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return PackError{PackError::ManifestRead,
            "cannot open manifest: " + path.string()}.at(path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return PackError{PackError::ManifestRead,
            "failed reading manifest: " + path.string()}.at(path.string());
    }
    return Result<std::string>::ok(ss.str());
}

Result<Value> parse_manifest(const std::string& text, const std::string& source_path) {
    toml::table doc;
    try {
        doc = toml::parse(text, source_path);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        std::string where = source_path.empty() ? std::string("<manifest>") : source_path;
        return PackError{PackError::ManifestParse,
            "TOML parse error in " + where + ": " + std::string(e.description())}
            .at(where, static_cast<int>(begin.line), static_cast<int>(begin.column));
    }

    return Result<Value>::ok(Value(convert_table(doc)));
}

Result<Value> load_manifest(const fs::path& path) {
    auto text = read_manifest(path);
    if (text.is_err()) return std::move(text).error();

    log::trace("parsing %s (%zu bytes)", path.string().c_str(), text.value().size());
    return parse_manifest(text.value(), path.string());
}

} // namespace packmeta
