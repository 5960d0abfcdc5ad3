/**
 * @file qbm/cors/cors/result.h
 * @brief Defines `Error` and `Result<T>` used by the CORS configuration paths.
 *
 * Building a policy can fail on a misconfiguration. Instead of aborting, the
 * builders return a `Result<T>` holding either the built value or the `Error`
 * that prevented it, and the hosting application decides how to surface it.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace qb::cors {

/**
 * @brief A configuration error.
 */
struct Error {
    std::string field;   ///< Configuration key at fault (e.g. "origins").
    std::string message; ///< Human readable description.

    Error(std::string field_name, std::string msg)
        : field(std::move(field_name)), message(std::move(msg)) {}

    /** @brief "field: message", suitable for logs and exception text. */
    [[nodiscard]] std::string to_string() const {
        return field.empty() ? message : field + ": " + message;
    }
};

/**
 * @brief Holds either a value of type T or an `Error`.
 */
template <typename T>
class Result {
private:
    std::variant<T, Error> _data;

public:
    Result(T value) : _data(std::move(value)) {}
    Result(Error error) : _data(std::move(error)) {}

    /**
     * @brief Checks if the operation succeeded.
     * @return True if a value is held, false if an error is held.
     */
    [[nodiscard]] bool success() const noexcept {
        return std::holds_alternative<T>(_data);
    }

    explicit operator bool() const noexcept { return success(); }

    /**
     * @brief Accesses the held value.
     * @throws std::logic_error if the result holds an error.
     */
    [[nodiscard]] const T &value() const & {
        if (!success())
            throw std::logic_error("Result::value() called on error: " + error().to_string());
        return std::get<T>(_data);
    }

    [[nodiscard]] T &&value() && {
        if (!success())
            throw std::logic_error("Result::value() called on error: " + error().to_string());
        return std::get<T>(std::move(_data));
    }

    /**
     * @brief Accesses the held error.
     * @throws std::logic_error if the result holds a value.
     */
    [[nodiscard]] const Error &error() const {
        if (success())
            throw std::logic_error("Result::error() called on success");
        return std::get<Error>(_data);
    }
};

} // namespace qb::cors
