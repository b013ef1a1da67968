#include <packmeta/pack_config.hpp>

namespace packmeta {

static std::string list_to_string(const std::optional<std::vector<std::string>>& list) {
    if (!list) return "None";
    std::string out = "[";
    for (size_t i = 0; i < list->size(); i++) {
        if (i > 0) out += ", ";
        out += quote_string((*list)[i]);
    }
    out += "]";
    return out;
}

std::string PackConfig::to_string() const {
    return "PackConfig { files: " + list_to_string(files) +
           ", default_packers: " + list_to_string(default_packers) + " }";
}

Result<PackConfig> Decoder<PackConfig>::decode(const Value& v, const std::string& at) {
    PackConfig cfg;
    TableDecoder td(v, at);
    td.optional("files", cfg.files)
      .optional("default-packers", cfg.default_packers);

    auto st = td.finish();
    if (st.is_err()) return std::move(st).error();
    return Result<PackConfig>::ok(std::move(cfg));
}

} // namespace packmeta
