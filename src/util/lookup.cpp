#include <packmeta/lookup.hpp>
#include <limits>

namespace packmeta {

bool parse_index(const std::string& segment, size_t& out) {
    if (segment.empty()) return false;

    size_t idx = 0;
    constexpr size_t max = std::numeric_limits<size_t>::max();
    for (char c : segment) {
        if (c < '0' || c > '9') return false;
        size_t digit = static_cast<size_t>(c - '0');
        if (idx > (max - digit) / 10) return false;
        idx = idx * 10 + digit;
    }
    out = idx;
    return true;
}

std::optional<Value> lookup(Value tree, const KeyPath& path) {
    Value current = std::move(tree);

    for (const auto& segment : path) {
        if (Table* table = current.as_table()) {
            // removing takes ownership without copying the subtree
            auto child = table->remove(segment);
            if (!child) return std::nullopt;
            current = std::move(*child);
        } else if (Array* array = current.as_array()) {
            size_t idx = 0;
            if (!parse_index(segment, idx) || idx >= array->size()) {
                return std::nullopt;
            }
            // the moved-from slot goes away with the rest of the array
            Value child = std::move((*array)[idx]);
            current = std::move(child);
        } else {
            return std::nullopt;
        }
    }

    return current;
}

} // namespace packmeta
