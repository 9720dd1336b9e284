#pragma once

#include <yarn2nix/error.hpp>
#include <variant>
#include <functional>

namespace yarn2nix {

template<typename T>
class Result {
    std::variant<T, Yarn2nixError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from Yarn2nixError so YARN2NIX_TRY can return errors across Result<T> types
    Result(Yarn2nixError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(Yarn2nixError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<Yarn2nixError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    Yarn2nixError& error() & { return std::get<Yarn2nixError>(data_); }
    const Yarn2nixError& error() const& { return std::get<Yarn2nixError>(data_); }
    Yarn2nixError&& error() && { return std::get<Yarn2nixError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define YARN2NIX_TRY(expr) \
    do { \
        auto _y2n_result = (expr); \
        if (_y2n_result.is_err()) return std::move(_y2n_result).error(); \
    } while(0)

} // namespace yarn2nix
