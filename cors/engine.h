/**
 * @file qbm/cors/cors/engine.h
 * @brief Defines `Engine`, the CORS decision pipeline.
 *
 * The engine evaluates one request at a time as a pure function of the shared
 * immutable `Policy` and the request's `RequestFacts`:
 *
 * 1. `Vary: Origin` is always emitted.
 * 2. No `Origin`: continue without CORS headers.
 * 3. Origin not admitted: stop.
 * 4. Preflight: validate (strict mode only), emit the allow headers on success, stop.
 * 5. Actual request: emit expose headers, then the allow-origin/credentials pair, continue.
 *
 * Evaluations share no mutable state and may run concurrently on any number of threads.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <memory>
#include <stdexcept>

#include "./decision.h"
#include "./policy.h"

namespace qb::cors {

class Engine {
private:
    std::shared_ptr<const Policy> _policy;

    void handle_preflight(const RequestFacts &facts, Decision &decision) const;
    void handle_actual(const RequestFacts &facts, Decision &decision) const;

public:
    /**
     * @brief Constructs an engine over a built policy.
     * @throws std::invalid_argument if `policy` is null.
     */
    explicit Engine(std::shared_ptr<const Policy> policy)
        : _policy(std::move(policy)) {
        if (!_policy) {
            throw std::invalid_argument("Engine: policy pointer cannot be null.");
        }
    }

    explicit Engine(Policy policy)
        : _policy(std::make_shared<const Policy>(std::move(policy))) {}

    /**
     * @brief Decides the fate of a request.
     * @param facts The request's CORS-relevant facts.
     * @return The outcome and the response headers to write, in order.
     */
    [[nodiscard]] Decision evaluate(const RequestFacts &facts) const;

    [[nodiscard]] const Policy &policy() const noexcept { return *_policy; }

    [[nodiscard]] const std::shared_ptr<const Policy> &shared_policy() const noexcept { return _policy; }
};

} // namespace qb::cors
