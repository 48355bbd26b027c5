#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorKind kind, std::string message) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
};

} // namespace sqlsandbox
