/**
 * @file qbm/cors/cors/policy.h
 * @brief Defines `Policy`, the immutable normalized CORS rules, and `PolicyBuilder`.
 *
 * A `Policy` is produced once from a `Config` and then shared read-only by every
 * request evaluation. All parsing (list splitting, header lowercasing, max-age and
 * credentials rendering) happens in `PolicyBuilder::build()`; nothing is re-derived
 * at request time, so concurrent readers need no synchronization.
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
#include <vector>

#include "./config.h"
#include "./result.h"

namespace qb::cors {

class PolicyBuilder;

/**
 * @brief Immutable, normalized CORS policy.
 */
class Policy {
    friend class PolicyBuilder;

private:
    bool _allow_all_origins = false;
    std::vector<std::string> _origins;
    std::vector<std::string> _methods;
    std::vector<std::string> _request_headers; ///< lowercased, for matching only
    std::string _methods_header;               ///< as configured, for Access-Control-Allow-Methods
    std::string _request_headers_header;       ///< as configured, for Access-Control-Allow-Headers
    std::string _exposed_headers;
    std::string _max_age = "0";
    bool _credentials = false;
    std::string _credentials_header = "false";
    bool _validate_headers = false;

    Policy() = default;

public:
    /**
     * @brief Builds a policy from a raw configuration.
     * @return The policy, or an `Error` if the configuration is unusable.
     */
    static Result<Policy> create(const Config &config);

    /** @brief True iff the origin rule is exactly "*". */
    [[nodiscard]] bool allow_all_origins() const noexcept { return _allow_all_origins; }

    /** @brief Configured origins (unused when `allow_all_origins()`). */
    [[nodiscard]] const std::vector<std::string> &origins() const noexcept { return _origins; }

    /** @brief Configured methods, in configured order. */
    [[nodiscard]] const std::vector<std::string> &methods() const noexcept { return _methods; }

    /** @brief Configured request headers, lowercased. */
    [[nodiscard]] const std::vector<std::string> &request_headers() const noexcept { return _request_headers; }

    /** @brief Value of Access-Control-Allow-Methods on a successful preflight. */
    [[nodiscard]] const std::string &methods_header() const noexcept { return _methods_header; }

    /** @brief Value of Access-Control-Allow-Headers on a successful preflight, original case. */
    [[nodiscard]] const std::string &request_headers_header() const noexcept { return _request_headers_header; }

    /** @brief Value of Access-Control-Expose-Headers; empty means omit. */
    [[nodiscard]] const std::string &exposed_headers() const noexcept { return _exposed_headers; }

    /** @brief Preflight cache lifetime in whole seconds; "0" means omit. */
    [[nodiscard]] const std::string &max_age() const noexcept { return _max_age; }

    [[nodiscard]] bool credentials() const noexcept { return _credentials; }

    /** @brief "true" or "false". */
    [[nodiscard]] const std::string &credentials_header() const noexcept { return _credentials_header; }

    /** @brief Strict mode: validate preflight method and headers against the allow-lists. */
    [[nodiscard]] bool validate_headers() const noexcept { return _validate_headers; }

    /** @brief Whether `origin` is admitted (wildcard or exact match). */
    [[nodiscard]] bool allows_origin(std::string_view origin) const noexcept;

    /** @brief Preflight method check; always true outside strict mode. */
    [[nodiscard]] bool allows_method(std::string_view method) const noexcept;

    /** @brief Preflight header list check; always true outside strict mode. */
    [[nodiscard]] bool allows_headers(std::string_view requested_headers) const;
};

/**
 * @brief Consumes raw configuration once and produces an immutable `Policy`.
 *
 * @code
 * auto result = qb::cors::PolicyBuilder()
 *                   .origins("https://a.com, https://b.com")
 *                   .methods("GET, POST")
 *                   .credentials(true)
 *                   .build();
 * if (!result)
 *     LOG_CORS_ERROR(result.error().to_string());
 * @endcode
 */
class PolicyBuilder {
private:
    Config _config;

public:
    /** @brief Starts from an empty configuration (no origin: `build()` fails until one is set). */
    PolicyBuilder() = default;

    /** @brief Starts from an existing configuration. */
    explicit PolicyBuilder(Config config)
        : _config(std::move(config)) {}

    PolicyBuilder &origins(std::string value);
    PolicyBuilder &methods(std::string value);
    PolicyBuilder &request_headers(std::string value);
    PolicyBuilder &exposed_headers(std::string value);
    PolicyBuilder &max_age(std::chrono::milliseconds value);
    PolicyBuilder &credentials(bool value);
    PolicyBuilder &validate_headers(bool value);

    /** @brief The configuration accumulated so far. */
    [[nodiscard]] const Config &config() const noexcept { return _config; }

    /**
     * @brief Normalizes the configuration into a `Policy`.
     *
     * Fails when the origin rule is empty or the max age is negative.
     */
    [[nodiscard]] Result<Policy> build() const;
};

} // namespace qb::cors
