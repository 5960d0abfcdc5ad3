/**
 * @file qbm/cors/middleware/middleware_interface.h
 * @brief Defines the IMiddleware interface for request interceptors.
 *
 * A middleware receives the exchange of the current request, may read the request
 * and write response headers, and must call `ctx->complete()` exactly once to tell
 * the host whether the chain continues.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <memory>
#include <string>

#include "../exchange.h"

namespace qb::cors {

/**
 * @brief Interface for middleware.
 */
class IMiddleware {
public:
    virtual ~IMiddleware() = default;

    /**
     * @brief Handles the request.
     * @param ctx The exchange for the request. The middleware must call
     *            ctx->complete() when its processing is done.
     */
    virtual void process(std::shared_ptr<IExchange> ctx) = 0;

    /**
     * @brief Returns the name of the middleware instance, for logging/debugging.
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

using MiddlewarePtr = std::shared_ptr<IMiddleware>;

} // namespace qb::cors
