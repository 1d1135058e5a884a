#pragma once

#include <scrub/error.hpp>
#include <variant>
#include <functional>

namespace scrub {

template<typename T>
class Result {
    std::variant<T, ScrubError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ScrubError so SCRUB_TRY can return errors across Result<T> types
    Result(ScrubError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ScrubError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ScrubError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    // Value when Ok, otherwise the fallback; the error is dropped
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    ScrubError& error() & { return std::get<ScrubError>(data_); }
    const ScrubError& error() const& { return std::get<ScrubError>(data_); }
    ScrubError&& error() && { return std::get<ScrubError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
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

#define SCRUB_TRY(expr) \
    do { \
        auto _scrub_result = (expr); \
        if (_scrub_result.is_err()) return std::move(_scrub_result).error(); \
    } while(0)

} // namespace scrub
