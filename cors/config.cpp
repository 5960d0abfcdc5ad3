/**
 * @file qbm/cors/cors/config.cpp
 * @brief Implements `Config` defaults and JSON loading.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./config.h"

#include <cmath>
#include <limits>
#include <optional>
#include <vector>

#include "../logger.h"
#include "../utility.h"

namespace qb::cors {

namespace {

constexpr std::string_view KEY_VALIDATE_HEADERS = "validate_headers";
constexpr std::string_view KEY_ORIGINS = "origins";
constexpr std::string_view KEY_REQUEST_HEADERS = "request_headers";
constexpr std::string_view KEY_EXPOSED_HEADERS = "exposed_headers";
constexpr std::string_view KEY_METHODS = "methods";
constexpr std::string_view KEY_MAX_AGE = "max_age";
constexpr std::string_view KEY_CREDENTIALS = "credentials";

// Reads a list field written either as "A, B" or ["A", "B"].
std::optional<Error>
read_list(const qb::json &value, std::string_view key, std::string &out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return std::nullopt;
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        items.reserve(value.size());
        for (const auto &item : value) {
            if (!item.is_string())
                return Error(std::string(key), "array items must be strings");
            items.push_back(item.get<std::string>());
        }
        out = utility::join(items, ", ");
        return std::nullopt;
    }
    return Error(std::string(key), "expected a string or an array of strings");
}

std::optional<Error>
read_bool(const qb::json &value, std::string_view key, bool &out) {
    if (!value.is_boolean())
        return Error(std::string(key), "expected a boolean");
    out = value.get<bool>();
    return std::nullopt;
}

std::optional<Error>
read_seconds(const qb::json &value, std::string_view key, std::chrono::milliseconds &out) {
    if (!value.is_number())
        return Error(std::string(key), "expected a number of seconds");
    const auto seconds = value.get<double>();
    if (!std::isfinite(seconds))
        return Error(std::string(key), "must be finite");
    // 2^63 is exact as a double, the rep maximum is not
    using rep = std::chrono::milliseconds::rep;
    const double millis = std::round(seconds * 1000.0);
    if (millis >= -static_cast<double>(std::numeric_limits<rep>::min()) ||
        millis < static_cast<double>(std::numeric_limits<rep>::min()))
        return Error(std::string(key), "out of range");
    out = std::chrono::milliseconds(static_cast<rep>(millis));
    return std::nullopt;
}

} // namespace

Config
Config::defaults() {
    Config config;
    config.origins = "*";
    config.methods = "GET, PUT, POST, DELETE";
    config.request_headers = "Origin, Authorization, Content-Type";
    config.exposed_headers = "";
    config.max_age = std::chrono::minutes(1);
    config.credentials = true;
    config.validate_headers = false;
    return config;
}

Result<Config>
Config::from_json(const qb::json &document) {
    if (!document.is_object())
        return Error("", "CORS configuration must be a JSON object");

    Config config = defaults();
    for (auto it = document.begin(); it != document.end(); ++it) {
        const std::string &key = it.key();
        const qb::json &value = it.value();
        std::optional<Error> error;

        if (key == KEY_VALIDATE_HEADERS)
            error = read_bool(value, key, config.validate_headers);
        else if (key == KEY_ORIGINS)
            error = read_list(value, key, config.origins);
        else if (key == KEY_REQUEST_HEADERS)
            error = read_list(value, key, config.request_headers);
        else if (key == KEY_EXPOSED_HEADERS)
            error = read_list(value, key, config.exposed_headers);
        else if (key == KEY_METHODS)
            error = read_list(value, key, config.methods);
        else if (key == KEY_MAX_AGE)
            error = read_seconds(value, key, config.max_age);
        else if (key == KEY_CREDENTIALS)
            error = read_bool(value, key, config.credentials);
        else
            LOG_CORS_WARN("Ignoring unknown configuration key '" << key << "'");

        if (error) {
            LOG_CORS_ERROR("Invalid CORS configuration - " << error->to_string());
            return *error;
        }
    }
    return config;
}

Result<Config>
Config::from_json_string(std::string_view text) {
    qb::json document;
    try {
        document = qb::json::parse(std::string(text));
    } catch (const qb::json::exception &e) {
        LOG_CORS_ERROR("Failed to parse CORS configuration: " << e.what());
        return Error("", std::string("invalid JSON: ") + e.what());
    }
    return from_json(document);
}

qb::json
Config::to_json() const {
    qb::json document = qb::json::object();
    document[std::string(KEY_VALIDATE_HEADERS)] = validate_headers;
    document[std::string(KEY_ORIGINS)] = origins;
    document[std::string(KEY_REQUEST_HEADERS)] = request_headers;
    document[std::string(KEY_EXPOSED_HEADERS)] = exposed_headers;
    document[std::string(KEY_METHODS)] = methods;
    document[std::string(KEY_MAX_AGE)] = static_cast<double>(max_age.count()) / 1000.0;
    document[std::string(KEY_CREDENTIALS)] = credentials;
    return document;
}

} // namespace qb::cors
