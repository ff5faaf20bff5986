#pragma once

#include <lode/error.hpp>
#include <variant>
#include <functional>

namespace lode {

// Value-or-error return type used across the public API.
// Nothing in lode throws past a Result boundary.
template<typename T>
class Result {
    std::variant<T, LodeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from LodeError so LODE_TRY can forward errors across Result<T> types
    Result(LodeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(LodeError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<LodeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    LodeError& error() & { return std::get<LodeError>(data_); }
    const LodeError& error() const& { return std::get<LodeError>(data_); }
    LodeError&& error() && { return std::get<LodeError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    // Rewrite the error (e.g. to attach a file name) and keep values untouched.
    template<typename F>
    Result map_err(F&& f) && {
        if (is_err()) {
            return Result::err(f(std::move(*this).error()));
        }
        return std::move(*this);
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define LODE_TRY(expr) \
    do { \
        auto _lode_result = (expr); \
        if (_lode_result.is_err()) return std::move(_lode_result).error(); \
    } while(0)

} // namespace lode
