#pragma once

#include <tsorg/error.hpp>
#include <variant>

namespace tsorg {

// Value or TsorgError. Stages return errors instead of throwing; callers
// check is_ok()/is_err() or forward with TSORG_TRY.
template<typename T>
class Result {
    std::variant<T, TsorgError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TsorgError so TSORG_TRY can return errors across Result<T> types
    Result(TsorgError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TsorgError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TsorgError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TsorgError& error() & { return std::get<TsorgError>(data_); }
    const TsorgError& error() const& { return std::get<TsorgError>(data_); }
    TsorgError&& error() && { return std::get<TsorgError>(std::move(data_)); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TSORG_TRY(expr) \
    do { \
        auto _tsorg_result = (expr); \
        if (_tsorg_result.is_err()) return std::move(_tsorg_result).error(); \
    } while(0)

} // namespace tsorg
