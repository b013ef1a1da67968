#pragma once

#include <packmeta/error.hpp>
#include <variant>
#include <utility>

namespace packmeta {

template<typename T>
class Result {
    std::variant<T, PackError> data_;

    explicit Result(T val) : data_(std::in_place_index<0>, std::move(val)) {}

public:
    // Implicit from PackError so PACKMETA_TRY can forward errors between Result types
    Result(PackError err) : data_(std::in_place_index<1>, std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PackError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    PackError& error() & { return std::get<1>(data_); }
    const PackError& error() const& { return std::get<1>(data_); }
    PackError&& error() && { return std::get<1>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) && -> Result<decltype(f(std::declval<T&&>()))> {
        using U = decltype(f(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>::ok(f(std::move(*this).value()));
        }
        return Result<U>::err(std::move(*this).error());
    }

    template<typename F>
    auto and_then(F&& f) && -> decltype(f(std::declval<T&&>())) {
        if (is_ok()) {
            return f(std::move(*this).value());
        }
        using RetType = decltype(f(std::declval<T&&>()));
        return RetType::err(std::move(*this).error());
    }

    template<typename F>
    Result or_else(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return f(std::move(*this).error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PACKMETA_TRY(expr) \
    do { \
        auto _packmeta_result = (expr); \
        if (_packmeta_result.is_err()) return std::move(_packmeta_result).error(); \
    } while(0)

} // namespace packmeta
