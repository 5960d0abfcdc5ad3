/**
 * @file qbm/cors/cors/config.h
 * @brief Defines `Config`, the raw CORS configuration record supplied by the host at startup.
 *
 * `Config` is the public facing form of a CORS policy: comma-space delimited lists
 * and plain scalars, as an operator would write them. It is consumed once by
 * `PolicyBuilder` / `Policy::create()` and never read at request time.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <qb/json.h>

#include "./result.h"

namespace qb::cors {

/**
 * @brief Raw CORS configuration.
 *
 * @code
 * qb::cors::Config config = qb::cors::Config::defaults();
 * config.origins = "https://app.example.com, https://admin.example.com";
 * config.credentials = true;
 * @endcode
 */
struct Config {
    /**
     * When true, the preflight's requested method and headers must be a subset of
     * `methods` and `request_headers`. When false the server always advertises its
     * allowed sets and leaves enforcement to the browser.
     */
    bool validate_headers = false;

    /// Comma-space delimited list of origins, or "*" to match every origin. Must not be empty.
    std::string origins;

    /// Request headers the resource accepts. Rendered verbatim in Access-Control-Allow-Headers.
    std::string request_headers;

    /// Response headers readable by the client, beyond the CORS-safelisted ones. Empty to omit.
    std::string exposed_headers;

    /// Comma-space delimited list of accepted methods. Rendered verbatim in Access-Control-Allow-Methods.
    std::string methods;

    /// How long the client may cache a preflight response. Zero omits Access-Control-Max-Age.
    std::chrono::milliseconds max_age{0};

    /// Whether cookies and Authorization headers are allowed. Advertised, not enforced.
    bool credentials = false;

    /**
     * @brief The recommended starting configuration.
     *
     * Every origin, `GET, PUT, POST, DELETE`, `Origin, Authorization, Content-Type`,
     * one minute max age, credentials on, no strict validation.
     */
    static Config defaults();

    /**
     * @brief Loads a configuration from a JSON object.
     *
     * Keys absent from `document` keep their `defaults()` value. `origins`, `methods`,
     * `request_headers` and `exposed_headers` accept either a string or an array of
     * strings; `max_age` is a number of seconds.
     *
     * @param document A JSON object.
     * @return The configuration, or an `Error` naming the offending key.
     */
    static Result<Config> from_json(const qb::json &document);

    /**
     * @brief Parses JSON text and loads it with `from_json()`.
     * @param text JSON document text.
     */
    static Result<Config> from_json_string(std::string_view text);

    /** @brief Renders the configuration as a JSON object accepted by `from_json()`. */
    [[nodiscard]] qb::json to_json() const;
};

} // namespace qb::cors
