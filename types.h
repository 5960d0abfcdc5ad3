/**
 * @file qbm/cors/types.h
 * @brief Core CORS type definitions
 *
 * This file defines the header names consumed and produced by the CORS module,
 * the HTTP method tokens it cares about, and the enumerations describing the
 * outcome of a CORS decision.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <string_view>   // For std::string_view
#include <ostream>       // For std::ostream

namespace qb::cors {
    /**
     * @brief Names of the HTTP headers involved in CORS negotiation.
     */
    namespace header {
        // Request side
        constexpr std::string_view ORIGIN = "Origin";
        constexpr std::string_view REQUEST_METHOD = "Access-Control-Request-Method";
        constexpr std::string_view REQUEST_HEADERS = "Access-Control-Request-Headers";

        // Response side
        constexpr std::string_view VARY = "Vary";
        constexpr std::string_view ALLOW_ORIGIN = "Access-Control-Allow-Origin";
        constexpr std::string_view ALLOW_CREDENTIALS = "Access-Control-Allow-Credentials";
        constexpr std::string_view ALLOW_METHODS = "Access-Control-Allow-Methods";
        constexpr std::string_view ALLOW_HEADERS = "Access-Control-Allow-Headers";
        constexpr std::string_view MAX_AGE = "Access-Control-Max-Age";
        constexpr std::string_view EXPOSE_HEADERS = "Access-Control-Expose-Headers";
    } // namespace header

    /**
     * @brief HTTP method tokens. Methods are compared case-sensitively.
     */
    namespace method {
        constexpr std::string_view GET = "GET";
        constexpr std::string_view OPTIONS = "OPTIONS";
    } // namespace method

    /**
     * @brief What the host must do with the request after the CORS middleware ran.
     */
    enum class Outcome {
        CONTINUE, ///< Forward the request to the next handler in the chain.
        STOP      ///< Terminate the chain now; downstream handlers are not invoked.
    };

    /**
     * @brief How the decision pipeline classified a request.
     */
    enum class RequestKind {
        NOT_CORS,        ///< No `Origin` header: not a cross-origin request.
        ORIGIN_REJECTED, ///< `Origin` present but not admitted by the policy.
        PREFLIGHT,       ///< `OPTIONS` carrying a non-empty `Access-Control-Request-Method`.
        ACTUAL           ///< Any other admitted cross-origin request.
    };

    [[nodiscard]] constexpr std::string_view
    to_string(Outcome outcome) noexcept {
        switch (outcome) {
            case Outcome::CONTINUE: return "CONTINUE";
            case Outcome::STOP:     return "STOP";
        }
        return "UNKNOWN";
    }

    [[nodiscard]] constexpr std::string_view
    to_string(RequestKind kind) noexcept {
        switch (kind) {
            case RequestKind::NOT_CORS:        return "NOT_CORS";
            case RequestKind::ORIGIN_REJECTED: return "ORIGIN_REJECTED";
            case RequestKind::PREFLIGHT:       return "PREFLIGHT";
            case RequestKind::ACTUAL:          return "ACTUAL";
        }
        return "UNKNOWN";
    }

    inline std::ostream &
    operator<<(std::ostream &os, Outcome outcome) {
        return os << to_string(outcome);
    }

    inline std::ostream &
    operator<<(std::ostream &os, RequestKind kind) {
        return os << to_string(kind);
    }
} // namespace qb::cors
