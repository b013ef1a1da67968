#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace packmeta {

class Value;

// TOML date-time in all four flavours: offset date-time, local date-time,
// local date and local time. Absent parts are std::nullopt.
struct Datetime {
    struct Date {
        int year = 0;
        int month = 0;
        int day = 0;
    };
    struct Time {
        int hour = 0;
        int minute = 0;
        int second = 0;
        int nanosecond = 0;
    };

    std::optional<Date> date;
    std::optional<Time> time;
    std::optional<int> offset_minutes;  // only with both date and time

    std::string to_string() const;
    bool operator==(const Datetime& other) const;
    bool operator!=(const Datetime& other) const { return !(*this == other); }
};

using Array = std::vector<Value>;

// String-keyed mapping with unique keys. Entries keep insertion order,
// which only matters for printing.
class Table {
public:
    Table() = default;

    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }
    bool contains(const std::string& key) const;

    Value* find(const std::string& key);
    const Value* find(const std::string& key) const;

    // Replaces the existing value when the key is already present
    void insert_or_assign(std::string key, Value value);

    // Moves the entry out of the table
    std::optional<Value> remove(const std::string& key);

    const std::string& key_at(size_t i) const { return keys_[i]; }
    const Value& value_at(size_t i) const;
    Value& value_at(size_t i);

    const std::vector<std::string>& keys() const { return keys_; }

    // Key order does not take part in equality
    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<std::string> keys_;
    std::vector<Value> values_;

    std::optional<size_t> index_of(const std::string& key) const;
};

class Value {
public:
    enum class Kind { Table, Array, String, Integer, Float, Boolean, Datetime };

    using Storage = std::variant<Table, Array, std::string, int64_t,
                                 double, bool, Datetime>;

    Value() : data_(Table{}) {}
    Value(Table t) : data_(std::move(t)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(int64_t i) : data_(i) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(bool b) : data_(b) {}
    Value(Datetime dt) : data_(std::move(dt)) {}

    static Value make_table(std::initializer_list<std::pair<std::string, Value>> entries);
    static Value make_array(std::initializer_list<Value> items);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    static const char* kind_name(Kind k);
    const char* kind_name() const { return kind_name(kind()); }

    bool is_table() const { return kind() == Kind::Table; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_boolean() const { return kind() == Kind::Boolean; }
    bool is_datetime() const { return kind() == Kind::Datetime; }
    bool is_scalar() const { return !is_table() && !is_array(); }

    Table* as_table() { return std::get_if<Table>(&data_); }
    const Table* as_table() const { return std::get_if<Table>(&data_); }
    Array* as_array() { return std::get_if<Array>(&data_); }
    const Array* as_array() const { return std::get_if<Array>(&data_); }
    const std::string* as_string() const { return std::get_if<std::string>(&data_); }
    const int64_t* as_integer() const { return std::get_if<int64_t>(&data_); }
    const double* as_float() const { return std::get_if<double>(&data_); }
    const bool* as_boolean() const { return std::get_if<bool>(&data_); }
    const Datetime* as_datetime() const { return std::get_if<Datetime>(&data_); }

    Storage& storage() { return data_; }
    const Storage& storage() const { return data_; }

    // Compact inline rendering, e.g. { files = ["README.md"], n = 3 }
    std::string dump() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage data_;
};

} // namespace packmeta
