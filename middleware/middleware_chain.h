/**
 * @file qbm/cors/middleware/middleware_chain.h
 * @brief Defines MiddlewareChain, a minimal synchronous handler chain.
 *
 * The chain runs its middlewares in order over an `Exchange` and invokes the final
 * handler only if every middleware completed with `Outcome::CONTINUE`. It is the
 * reference host for the CORS middleware and what hosts without a router of their
 * own can use directly.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "./middleware_interface.h"
#include "../exchange.h"
#include "../logger.h"

namespace qb::cors {

class MiddlewareChain {
public:
    using HandlerFn = std::function<void(std::shared_ptr<Exchange>)>;

private:
    std::vector<MiddlewarePtr> _middlewares;
    HandlerFn _handler;

public:
    MiddlewareChain() = default;

    explicit MiddlewareChain(std::vector<MiddlewarePtr> middlewares, HandlerFn handler = nullptr)
        : _middlewares(std::move(middlewares)), _handler(std::move(handler)) {}

    /**
     * @brief Appends a middleware.
     * @throws std::invalid_argument if `middleware` is null.
     */
    MiddlewareChain &use(MiddlewarePtr middleware) {
        if (!middleware) {
            throw std::invalid_argument("MiddlewareChain: middleware pointer cannot be null.");
        }
        _middlewares.push_back(std::move(middleware));
        return *this;
    }

    /** @brief Sets the handler invoked after every middleware continued. */
    MiddlewareChain &handler(HandlerFn fn) {
        _handler = std::move(fn);
        return *this;
    }

    [[nodiscard]] std::size_t size() const noexcept { return _middlewares.size(); }

    /**
     * @brief Runs the chain.
     * @return `CONTINUE` if the request reached the handler, `STOP` otherwise.
     */
    Outcome run(const std::shared_ptr<Exchange> &exchange) const {
        for (const auto &middleware : _middlewares) {
            exchange->reset_outcome();
            middleware->process(exchange);

            const auto &outcome = exchange->outcome();
            if (!outcome) {
                LOG_CORS_ERROR("MiddlewareChain: [" << middleware->name()
                               << "] returned without completing, chain stopped");
                return Outcome::STOP;
            }
            if (*outcome == Outcome::STOP) {
                LOG_CORS_TRACE("MiddlewareChain: [" << middleware->name() << "] stopped the chain");
                return Outcome::STOP;
            }
        }
        if (_handler)
            _handler(exchange);
        return Outcome::CONTINUE;
    }
};

} // namespace qb::cors
