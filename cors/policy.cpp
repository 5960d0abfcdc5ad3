/**
 * @file qbm/cors/cors/policy.cpp
 * @brief Implements `Policy` and `PolicyBuilder`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./policy.h"

#include <cmath>

#include "./matchers.h"
#include "../logger.h"
#include "../utility.h"

namespace qb::cors {

namespace {

constexpr std::string_view LIST_SEPARATOR = ", ";

// Whole seconds, rounded to nearest with ties to even.
std::string
render_seconds(std::chrono::milliseconds age) {
    const auto seconds = std::nearbyint(static_cast<double>(age.count()) / 1000.0);
    return std::to_string(static_cast<long long>(seconds));
}

} // namespace

Result<Policy>
Policy::create(const Config &config) {
    return PolicyBuilder(config).build();
}

bool
Policy::allows_origin(std::string_view origin) const noexcept {
    return _allow_all_origins || match::origin(origin, _origins);
}

bool
Policy::allows_method(std::string_view method) const noexcept {
    return !_validate_headers || match::method(method, _methods);
}

bool
Policy::allows_headers(std::string_view requested_headers) const {
    return !_validate_headers || match::headers(requested_headers, _request_headers);
}

PolicyBuilder &
PolicyBuilder::origins(std::string value) {
    _config.origins = std::move(value);
    return *this;
}

PolicyBuilder &
PolicyBuilder::methods(std::string value) {
    _config.methods = std::move(value);
    return *this;
}

PolicyBuilder &
PolicyBuilder::request_headers(std::string value) {
    _config.request_headers = std::move(value);
    return *this;
}

PolicyBuilder &
PolicyBuilder::exposed_headers(std::string value) {
    _config.exposed_headers = std::move(value);
    return *this;
}

PolicyBuilder &
PolicyBuilder::max_age(std::chrono::milliseconds value) {
    _config.max_age = value;
    return *this;
}

PolicyBuilder &
PolicyBuilder::credentials(bool value) {
    _config.credentials = value;
    return *this;
}

PolicyBuilder &
PolicyBuilder::validate_headers(bool value) {
    _config.validate_headers = value;
    return *this;
}

Result<Policy>
PolicyBuilder::build() const {
    if (_config.origins.empty()) {
        Error error("origins",
                    "at least one origin is required; remove the CORS middleware to disable CORS");
        LOG_CORS_ERROR("Invalid CORS policy - " << error.to_string());
        return error;
    }
    if (_config.max_age.count() < 0) {
        Error error("max_age", "must not be negative");
        LOG_CORS_ERROR("Invalid CORS policy - " << error.to_string());
        return error;
    }

    Policy policy;
    policy._allow_all_origins = _config.origins == "*";
    policy._origins = utility::split_list(_config.origins, LIST_SEPARATOR);
    policy._methods = utility::split_list(_config.methods, LIST_SEPARATOR);
    // Empty names are kept so that an empty header list admits an empty probe
    policy._request_headers = utility::split_list(_config.request_headers, LIST_SEPARATOR, true);
    for (auto &name : policy._request_headers)
        name = utility::to_lower(name);

    policy._methods_header = _config.methods;
    policy._request_headers_header = _config.request_headers;
    policy._exposed_headers = _config.exposed_headers;
    policy._max_age = render_seconds(_config.max_age);
    policy._credentials = _config.credentials;
    policy._credentials_header = _config.credentials ? "true" : "false";
    policy._validate_headers = _config.validate_headers;

    LOG_CORS_DEBUG("CORS policy built: origins=" << (policy._allow_all_origins ? "*" : _config.origins)
                   << " methods=" << policy._methods_header
                   << " max_age=" << policy._max_age
                   << " credentials=" << policy._credentials_header
                   << " strict=" << (policy._validate_headers ? "yes" : "no"));
    return policy;
}

} // namespace qb::cors
