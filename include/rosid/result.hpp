#pragma once

#include <rosid/error.hpp>
#include <variant>
#include <utility>

namespace rosid {

template<typename T>
class Result {
    std::variant<T, RosidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from RosidError so ROSID_TRY can forward errors across Result<T> types
    Result(RosidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RosidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<RosidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    RosidError& error() & { return std::get<RosidError>(data_); }
    const RosidError& error() const& { return std::get<RosidError>(data_); }
    RosidError&& error() && { return std::get<RosidError>(std::move(data_)); }

    T value_or(T fallback) const {
        if (is_ok()) return std::get<T>(data_);
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ROSID_TRY(expr) \
    do { \
        auto _rosid_result = (expr); \
        if (_rosid_result.is_err()) return std::move(_rosid_result).error(); \
    } while(0)

} // namespace rosid
