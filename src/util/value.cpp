#include <packmeta/value.hpp>
#include <packmeta/key_path.hpp>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace packmeta {

// ---------------------------------------------------------------------------
// Datetime
// ---------------------------------------------------------------------------

static bool same_date(const Datetime::Date& a, const Datetime::Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

static bool same_time(const Datetime::Time& a, const Datetime::Time& b) {
    return a.hour == b.hour && a.minute == b.minute &&
           a.second == b.second && a.nanosecond == b.nanosecond;
}

bool Datetime::operator==(const Datetime& other) const {
    if (date.has_value() != other.date.has_value()) return false;
    if (time.has_value() != other.time.has_value()) return false;
    if (date && !same_date(*date, *other.date)) return false;
    if (time && !same_time(*time, *other.time)) return false;
    return offset_minutes == other.offset_minutes;
}

std::string Datetime::to_string() const {
    char buf[64];
    std::string out;

    if (date) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      date->year, date->month, date->day);
        out += buf;
    }
    if (time) {
        if (date) out += 'T';
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                      time->hour, time->minute, time->second);
        out += buf;
        if (time->nanosecond > 0) {
            std::snprintf(buf, sizeof(buf), ".%09d", time->nanosecond);
            std::string frac(buf);
            while (frac.size() > 2 && frac.back() == '0') frac.pop_back();
            out += frac;
        }
    }
    if (offset_minutes) {
        int off = *offset_minutes;
        if (off == 0) {
            out += 'Z';
        } else {
            char sign = off < 0 ? '-' : '+';
            off = off < 0 ? -off : off;
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, off / 60, off % 60);
            out += buf;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

std::optional<size_t> Table::index_of(const std::string& key) const {
    for (size_t i = 0; i < keys_.size(); i++) {
        if (keys_[i] == key) return i;
    }
    return std::nullopt;
}

bool Table::contains(const std::string& key) const {
    return index_of(key).has_value();
}

Value* Table::find(const std::string& key) {
    auto idx = index_of(key);
    return idx ? &values_[*idx] : nullptr;
}

const Value* Table::find(const std::string& key) const {
    auto idx = index_of(key);
    return idx ? &values_[*idx] : nullptr;
}

void Table::insert_or_assign(std::string key, Value value) {
    if (auto idx = index_of(key)) {
        values_[*idx] = std::move(value);
        return;
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
}

std::optional<Value> Table::remove(const std::string& key) {
    auto idx = index_of(key);
    if (!idx) return std::nullopt;

    Value taken = std::move(values_[*idx]);
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(*idx));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(*idx));
    return taken;
}

const Value& Table::value_at(size_t i) const {
    return values_[i];
}

Value& Table::value_at(size_t i) {
    return values_[i];
}

bool Table::operator==(const Table& other) const {
    if (size() != other.size()) return false;
    for (size_t i = 0; i < keys_.size(); i++) {
        const Value* theirs = other.find(keys_[i]);
        if (!theirs || *theirs != values_[i]) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value Value::make_table(std::initializer_list<std::pair<std::string, Value>> entries) {
    Table t;
    for (const auto& [key, val] : entries) {
        t.insert_or_assign(key, val);
    }
    return Value(std::move(t));
}

Value Value::make_array(std::initializer_list<Value> items) {
    return Value(Array(items));
}

const char* Value::kind_name(Kind k) {
    switch (k) {
        case Kind::Table:    return "table";
        case Kind::Array:    return "array";
        case Kind::String:   return "string";
        case Kind::Integer:  return "integer";
        case Kind::Float:    return "float";
        case Kind::Boolean:  return "boolean";
        case Kind::Datetime: return "datetime";
    }
    return "unknown";
}

static std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    std::ostringstream ss;
    ss.precision(17);
    ss << d;
    std::string s = ss.str();
    // keep floats recognizable as floats
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

static void dump_into(const Value& v, std::string& out) {
    switch (v.kind()) {
        case Value::Kind::Table: {
            const Table& t = *v.as_table();
            if (t.empty()) {
                out += "{}";
                break;
            }
            out += "{ ";
            for (size_t i = 0; i < t.size(); i++) {
                if (i > 0) out += ", ";
                out += format_key(t.key_at(i));
                out += " = ";
                dump_into(t.value_at(i), out);
            }
            out += " }";
            break;
        }
        case Value::Kind::Array: {
            const Array& a = *v.as_array();
            out += '[';
            for (size_t i = 0; i < a.size(); i++) {
                if (i > 0) out += ", ";
                dump_into(a[i], out);
            }
            out += ']';
            break;
        }
        case Value::Kind::String:
            out += quote_string(*v.as_string());
            break;
        case Value::Kind::Integer:
            out += std::to_string(*v.as_integer());
            break;
        case Value::Kind::Float:
            out += format_float(*v.as_float());
            break;
        case Value::Kind::Boolean:
            out += *v.as_boolean() ? "true" : "false";
            break;
        case Value::Kind::Datetime:
            out += v.as_datetime()->to_string();
            break;
    }
}

std::string Value::dump() const {
    std::string out;
    dump_into(*this, out);
    return out;
}

} // namespace packmeta
