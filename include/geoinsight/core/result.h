#ifndef GEOINSIGHT_CORE_RESULT_H_
#define GEOINSIGHT_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "geoinsight/core/error.h"

namespace geoinsight {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("error message", Error::Code::INVALID_ARGUMENT);
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    // Success constructors
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Error constructors
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    static Result<T> error(const std::string& message,
                           Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(Error(message, code));
    }

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error("Attempting to access value of error result");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error("Attempting to access value of error result");
        }
        return std::move(std::get<T>(data_));
    }

    T&& take_value() { return std::move(std::get<T>(data_)); }

    std::string error() const {
        if (!has_error()) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return std::get<Error>(data_).what();
    }

    const Error& error_detail() const {
        if (!has_error()) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return std::get<Error>(data_);
    }

    Error::Code error_code() const { return error_detail().code(); }

private:
    std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    static Result<void> error(const std::string& message,
                              Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(Error(message, code));
    }

    bool ok() const { return !error_.has_value(); }
    bool has_error() const { return error_.has_value(); }

    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }

    const Error& error_detail() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_;
    }

    Error::Code error_code() const { return error_detail().code(); }

private:
    std::optional<Error> error_;
};

} // namespace core
} // namespace geoinsight

#endif // GEOINSIGHT_CORE_RESULT_H_
