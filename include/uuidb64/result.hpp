#pragma once

#include <uuidb64/error.hpp>
#include <utility>
#include <variant>

namespace uuidb64 {

template<typename T>
class Result {
    std::variant<T, UuidB64Error> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UuidB64Error so UUIDB64_TRY can return errors across Result<T> types
    Result(UuidB64Error err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UuidB64Error e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UuidB64Error>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UuidB64Error& error() & { return std::get<UuidB64Error>(data_); }
    const UuidB64Error& error() const& { return std::get<UuidB64Error>(data_); }
    UuidB64Error&& error() && { return std::get<UuidB64Error>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define UUIDB64_TRY(expr) \
    do { \
        auto _uuidb64_result = (expr); \
        if (_uuidb64_result.is_err()) return std::move(_uuidb64_result).error(); \
    } while(0)

} // namespace uuidb64
