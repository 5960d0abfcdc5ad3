/**
 * @file qbm/cors/exchange.cpp
 * @brief Implements the in-memory `Exchange` and the exchange helpers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./exchange.h"

#include "./logger.h"

namespace qb::cors {

RequestFacts
read_request_facts(const IExchange &exchange) {
    RequestFacts facts;
    facts.origin = exchange.request_header(header::ORIGIN);
    facts.method = exchange.method();
    // Probe headers only matter for OPTIONS
    if (facts.method == method::OPTIONS) {
        facts.requested_method = exchange.request_header(header::REQUEST_METHOD);
        facts.requested_headers = exchange.request_header(header::REQUEST_HEADERS);
    }
    return facts;
}

void
write_decision_headers(const Decision &decision, IExchange &exchange) {
    for (const auto &field : decision.headers) {
        if (field.append)
            exchange.add_header(field.name, field.value);
        else
            exchange.set_header(field.name, field.value);
    }
}

std::string
Exchange::request_header(std::string_view name) const {
    return _request_headers.get(name);
}

void
Exchange::set_header(std::string_view name, std::string value) {
    _response_headers.set(name, std::move(value));
}

void
Exchange::add_header(std::string_view name, std::string value) {
    _response_headers.add(name, std::move(value));
}

void
Exchange::complete(Outcome outcome) {
    if (_outcome) {
        LOG_CORS_WARN("Exchange::complete(" << outcome << ") ignored, already completed with "
                      << *_outcome);
        return;
    }
    _outcome = outcome;
    if (_on_complete)
        _on_complete(outcome);
}

} // namespace qb::cors
