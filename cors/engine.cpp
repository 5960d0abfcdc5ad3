/**
 * @file qbm/cors/cors/engine.cpp
 * @brief Implements the CORS decision pipeline.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./engine.h"

#include "../logger.h"

namespace qb::cors {

namespace {

void
set(Decision &decision, std::string_view name, std::string value) {
    decision.headers.push_back({std::string(name), std::move(value), false});
}

} // namespace

Decision
Engine::evaluate(const RequestFacts &facts) const {
    Decision decision;
    // Caches must not serve a CORS response to a non-CORS requester or vice versa
    decision.headers.push_back({std::string(header::VARY), std::string(header::ORIGIN), true});

    if (facts.origin.empty()) {
        decision.kind = RequestKind::NOT_CORS;
        decision.outcome = Outcome::CONTINUE;
        return decision;
    }

    if (!_policy->allows_origin(facts.origin)) {
        LOG_CORS_DEBUG("Origin '" << facts.origin << "' rejected for " << facts.method << " request");
        decision.kind = RequestKind::ORIGIN_REJECTED;
        decision.outcome = Outcome::STOP;
        return decision;
    }

    if (facts.is_preflight()) {
        decision.kind = RequestKind::PREFLIGHT;
        handle_preflight(facts, decision);
        // A preflight is answered here whether or not it validated
        decision.outcome = Outcome::STOP;
        return decision;
    }

    decision.kind = RequestKind::ACTUAL;
    handle_actual(facts, decision);
    decision.outcome = Outcome::CONTINUE;
    return decision;
}

void
Engine::handle_preflight(const RequestFacts &facts, Decision &decision) const {
    const auto &policy = *_policy;

    if (!policy.allows_method(facts.requested_method)) {
        LOG_CORS_DEBUG("Preflight from '" << facts.origin << "' probes disallowed method '"
                       << facts.requested_method << "'");
        return;
    }
    if (!policy.allows_headers(facts.requested_headers)) {
        LOG_CORS_DEBUG("Preflight from '" << facts.origin << "' probes disallowed headers '"
                       << facts.requested_headers << "'");
        return;
    }

    decision.preflight_valid = true;
    set(decision, header::ALLOW_METHODS, policy.methods_header());
    set(decision, header::ALLOW_HEADERS, policy.request_headers_header());
    if (policy.max_age() != "0")
        set(decision, header::MAX_AGE, policy.max_age());
}

void
Engine::handle_actual(const RequestFacts &facts, Decision &decision) const {
    const auto &policy = *_policy;

    if (!policy.exposed_headers().empty())
        set(decision, header::EXPOSE_HEADERS, policy.exposed_headers());

    // "*" cannot be used for a resource that supports credentials
    if (policy.credentials()) {
        set(decision, header::ALLOW_CREDENTIALS, policy.credentials_header());
        set(decision, header::ALLOW_ORIGIN, facts.origin);
    } else if (policy.allow_all_origins()) {
        set(decision, header::ALLOW_ORIGIN, "*");
    } else {
        set(decision, header::ALLOW_ORIGIN, facts.origin);
    }
}

} // namespace qb::cors
