/**
 * @file qbm/cors/middleware/cors.cpp
 * @brief Implements CorsMiddleware.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */

#include "./cors.h"

#include <stdexcept>

#include "../logger.h"

namespace qb::cors {

std::shared_ptr<CorsMiddleware>
CorsMiddleware::dev(const std::string &name) {
    return cors_middleware(Config::defaults(), name);
}

void
CorsMiddleware::process(std::shared_ptr<IExchange> ctx) {
    const auto facts = read_request_facts(*ctx);
    const auto decision = _engine.evaluate(facts);

    write_decision_headers(decision, *ctx);

    LOG_CORS_TRACE("[" << _name << "] " << facts.method << " origin='" << facts.origin
                   << "' kind=" << decision.kind << " outcome=" << decision.outcome);
    ctx->complete(decision.outcome);
}

std::shared_ptr<CorsMiddleware>
cors_middleware(const Config &config, const std::string &name) {
    auto result = Policy::create(config);
    if (!result) {
        throw std::invalid_argument("Invalid CORS configuration: " + result.error().to_string());
    }
    return std::make_shared<CorsMiddleware>(
        std::make_shared<const Policy>(std::move(result).value()), name);
}

} // namespace qb::cors
