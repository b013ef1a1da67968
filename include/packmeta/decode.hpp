#pragma once

#include <packmeta/key_path.hpp>
#include <packmeta/result.hpp>
#include <packmeta/value.hpp>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace packmeta {

// Shape-based conversion from a Value into T.
//
// Each specialization provides
//   static std::string expected();                        // "array of string"
//   static Result<T> decode(const Value& v, const std::string& at);
// where `at` is the dotted location of `v`, used in error messages.
//
// Caller-defined structs specialize Decoder and read their fields with
// TableDecoder.
template<typename T, typename Enable = void>
struct Decoder;

// Location helpers: "a.b" + "c" -> "a.b.c", "a.b" + 2 -> "a.b[2]"
std::string field_location(const std::string& at, const std::string& key);
std::string index_location(const std::string& at, size_t index);

PackError shape_error(const std::string& expected, const Value& found,
                      const std::string& at);

template<typename T>
Result<T> decode(const Value& v, const std::string& at = "") {
    return Decoder<T>::decode(v, at);
}

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

template<>
struct Decoder<Value> {
    static std::string expected() { return "any value"; }
    static Result<Value> decode(const Value& v, const std::string&) {
        return Result<Value>::ok(v);
    }
};

template<>
struct Decoder<std::string> {
    static std::string expected() { return "string"; }
    static Result<std::string> decode(const Value& v, const std::string& at) {
        if (const auto* s = v.as_string()) return Result<std::string>::ok(*s);
        return shape_error(expected(), v, at);
    }
};

template<>
struct Decoder<bool> {
    static std::string expected() { return "boolean"; }
    static Result<bool> decode(const Value& v, const std::string& at) {
        if (const auto* b = v.as_boolean()) return Result<bool>::ok(*b);
        return shape_error(expected(), v, at);
    }
};

template<typename T>
struct Decoder<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::string expected() { return "integer"; }
    static Result<T> decode(const Value& v, const std::string& at) {
        const auto* i = v.as_integer();
        if (!i) return shape_error(expected(), v, at);

        int64_t n = *i;
        bool fits;
        if constexpr (std::is_signed_v<T>) {
            fits = n >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                   n <= static_cast<int64_t>(std::numeric_limits<T>::max());
        } else {
            fits = n >= 0 &&
                   static_cast<uint64_t>(n) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        }
        if (!fits) {
            return PackError{PackError::DecodeShape,
                "integer " + std::to_string(n) + " out of range at '" +
                (at.empty() ? std::string("<root>") : at) + "'"}.with_subject(at);
        }
        return Result<T>::ok(static_cast<T>(n));
    }
};

template<typename T>
struct Decoder<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static std::string expected() { return "float"; }
    static Result<T> decode(const Value& v, const std::string& at) {
        if (const auto* d = v.as_float()) return Result<T>::ok(static_cast<T>(*d));
        if (const auto* i = v.as_integer()) return Result<T>::ok(static_cast<T>(*i));
        return shape_error(expected(), v, at);
    }
};

template<>
struct Decoder<Datetime> {
    static std::string expected() { return "datetime"; }
    static Result<Datetime> decode(const Value& v, const std::string& at) {
        if (const auto* dt = v.as_datetime()) return Result<Datetime>::ok(*dt);
        return shape_error(expected(), v, at);
    }
};

template<>
struct Decoder<Table> {
    static std::string expected() { return "table"; }
    static Result<Table> decode(const Value& v, const std::string& at) {
        if (const auto* t = v.as_table()) return Result<Table>::ok(*t);
        return shape_error(expected(), v, at);
    }
};

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

template<typename T>
struct Decoder<std::vector<T>> {
    static std::string expected() { return "array of " + Decoder<T>::expected(); }
    static Result<std::vector<T>> decode(const Value& v, const std::string& at) {
        const Array* arr = v.as_array();
        if (!arr) return shape_error(expected(), v, at);

        std::vector<T> out;
        out.reserve(arr->size());
        for (size_t i = 0; i < arr->size(); i++) {
            auto item = Decoder<T>::decode((*arr)[i], index_location(at, i));
            if (item.is_err()) return std::move(item).error();
            out.push_back(std::move(item).value());
        }
        return Result<std::vector<T>>::ok(std::move(out));
    }
};

template<typename T>
struct Decoder<std::map<std::string, T>> {
    static std::string expected() { return "table of " + Decoder<T>::expected(); }
    static Result<std::map<std::string, T>> decode(const Value& v, const std::string& at) {
        const Table* tbl = v.as_table();
        if (!tbl) return shape_error(expected(), v, at);

        std::map<std::string, T> out;
        for (size_t i = 0; i < tbl->size(); i++) {
            const std::string& key = tbl->key_at(i);
            auto item = Decoder<T>::decode(tbl->value_at(i), field_location(at, key));
            if (item.is_err()) return std::move(item).error();
            out.emplace(key, std::move(item).value());
        }
        return Result<std::map<std::string, T>>::ok(std::move(out));
    }
};

// A present value always decodes as T; absence is handled by the caller
template<typename T>
struct Decoder<std::optional<T>> {
    static std::string expected() { return Decoder<T>::expected(); }
    static Result<std::optional<T>> decode(const Value& v, const std::string& at) {
        auto inner = Decoder<T>::decode(v, at);
        if (inner.is_err()) return std::move(inner).error();
        return Result<std::optional<T>>::ok(std::optional<T>(std::move(inner).value()));
    }
};

// ---------------------------------------------------------------------------
// TableDecoder
// ---------------------------------------------------------------------------

// Reads named fields out of a table value. The first failure sticks and
// later field reads become no-ops; finish() reports it.
//
//   TableDecoder td(v, at);
//   td.required("name", out.name)
//     .optional("files", out.files)
//     .or_default("jobs", out.jobs);
//   PACKMETA_TRY(td.finish());
class TableDecoder {
public:
    TableDecoder(const Value& v, std::string at)
        : at_(std::move(at)) {
        table_ = v.as_table();
        if (!table_) error_ = shape_error("table", v, at_);
    }

    // Missing key is an error
    template<typename T>
    TableDecoder& required(const std::string& key, T& out) {
        if (error_) return *this;
        const Value* v = table_->find(key);
        if (!v) {
            std::string where = field_location(at_, key);
            error_ = PackError{PackError::DecodeShape,
                "missing field '" + key + "' in table at '" +
                (at_.empty() ? std::string("<root>") : at_) + "'"}.with_subject(where);
            return *this;
        }
        assign(key, *v, out);
        return *this;
    }

    // Missing key leaves `out` unspecified
    template<typename T>
    TableDecoder& optional(const std::string& key, std::optional<T>& out) {
        if (error_) return *this;
        out.reset();
        if (const Value* v = table_->find(key)) {
            T tmp{};
            if (assign(key, *v, tmp)) out = std::move(tmp);
        }
        return *this;
    }

    // Missing key keeps whatever `out` already holds
    template<typename T>
    TableDecoder& or_default(const std::string& key, T& out) {
        if (error_) return *this;
        if (const Value* v = table_->find(key)) assign(key, *v, out);
        return *this;
    }

    Status finish() {
        if (error_) return *error_;
        return ok_status();
    }

    const std::string& location() const { return at_; }

private:
    const Table* table_ = nullptr;
    std::string at_;
    std::optional<PackError> error_;

    template<typename T>
    bool assign(const std::string& key, const Value& v, T& out) {
        auto r = Decoder<T>::decode(v, field_location(at_, key));
        if (r.is_err()) {
            error_ = std::move(r).error();
            return false;
        }
        out = std::move(r).value();
        return true;
    }
};

} // namespace packmeta
