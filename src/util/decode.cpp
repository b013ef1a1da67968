#include <packmeta/decode.hpp>

namespace packmeta {

std::string field_location(const std::string& at, const std::string& key) {
    if (at.empty()) return format_key(key);
    return at + "." + format_key(key);
}

std::string index_location(const std::string& at, size_t index) {
    return at + "[" + std::to_string(index) + "]";
}

PackError shape_error(const std::string& expected, const Value& found,
                      const std::string& at) {
    std::string where = at.empty() ? std::string("<root>") : at;
    return PackError{PackError::DecodeShape,
        "expected " + expected + " at '" + where + "', found " + found.kind_name()}
        .with_subject(at);
}

} // namespace packmeta
