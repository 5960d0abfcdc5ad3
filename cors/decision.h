/**
 * @file qbm/cors/cors/decision.h
 * @brief Per-request input (`RequestFacts`) and output (`Decision`) of the CORS engine.
 *
 * Both types live for the duration of one request only.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace qb::cors {

/**
 * @brief The CORS-relevant facts of an inbound request.
 */
struct RequestFacts {
    std::string origin;            ///< `Origin`, empty if absent
    std::string method;            ///< request method, e.g. "GET"
    std::string requested_method;  ///< `Access-Control-Request-Method`, empty if absent
    std::string requested_headers; ///< raw `Access-Control-Request-Headers`

    /**
     * @brief `OPTIONS` with a non-empty `Access-Control-Request-Method`.
     * A bare `OPTIONS` is an actual request.
     */
    [[nodiscard]] bool is_preflight() const noexcept {
        return method == qb::cors::method::OPTIONS && !requested_method.empty();
    }
};

/**
 * @brief A response header the host must write.
 */
struct HeaderField {
    std::string name;
    std::string value;
    bool append = false; ///< add next to existing values instead of replacing them

    bool operator==(const HeaderField &other) const {
        return name == other.name && value == other.value && append == other.append;
    }
};

/**
 * @brief Result of evaluating one request against a policy.
 */
struct Decision {
    Outcome outcome = Outcome::CONTINUE;
    RequestKind kind = RequestKind::NOT_CORS;
    bool preflight_valid = false; ///< meaningful for `RequestKind::PREFLIGHT` only
    std::vector<HeaderField> headers;

    [[nodiscard]] bool should_continue() const noexcept { return outcome == Outcome::CONTINUE; }

    /** @brief First header written under `name` (exact name), or nullptr. */
    [[nodiscard]] const HeaderField *find(std::string_view name) const noexcept {
        for (const auto &field : headers) {
            if (field.name == name)
                return &field;
        }
        return nullptr;
    }

    [[nodiscard]] bool has(std::string_view name) const noexcept { return find(name) != nullptr; }

    /** @brief Value of `name`, empty when not written. */
    [[nodiscard]] std::string value(std::string_view name) const {
        const auto *field = find(name);
        return field ? field->value : std::string();
    }
};

} // namespace qb::cors
