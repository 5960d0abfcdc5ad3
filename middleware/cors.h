/**
 * @file qbm/cors/middleware/cors.h
 * @brief Defines the CorsMiddleware class for handling Cross-Origin Resource Sharing (CORS).
 *
 * CorsMiddleware binds the CORS `Engine` to a handler chain through the `IExchange`
 * hosting contract. It never sets a status code or a body: a rejected origin or an
 * answered preflight is signalled by `Outcome::STOP` and by which headers are present.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <memory>
#include <string>

#include "./middleware_interface.h"
#include "../cors/config.h"
#include "../cors/engine.h"
#include "../cors/policy.h"

namespace qb::cors {

/**
 * @brief Middleware enforcing a CORS policy.
 */
class CorsMiddleware : public IMiddleware {
private:
    Engine _engine;
    std::string _name;

public:
    /**
     * @brief Constructs the middleware over a built policy.
     * @param policy Shared immutable policy.
     * @param name An optional name for this middleware instance.
     */
    explicit CorsMiddleware(std::shared_ptr<const Policy> policy, std::string name = "CorsMiddleware")
        : _engine(std::move(policy)), _name(std::move(name)) {}

    explicit CorsMiddleware(Policy policy, std::string name = "CorsMiddleware")
        : _engine(std::move(policy)), _name(std::move(name)) {}

    /**
     * @brief Creates a CorsMiddleware with `Config::defaults()`, suitable for development.
     */
    static std::shared_ptr<CorsMiddleware> dev(const std::string &name = "DevCorsMiddleware");

    /**
     * @brief Evaluates the request and writes the resulting CORS headers.
     *
     * Completes with `CONTINUE` for non-CORS and admitted actual requests, and with
     * `STOP` for rejected origins and for every preflight.
     */
    void process(std::shared_ptr<IExchange> ctx) override;

    [[nodiscard]] std::string name() const override { return _name; }

    [[nodiscard]] const Engine &engine() const noexcept { return _engine; }

    [[nodiscard]] const Policy &policy() const noexcept { return _engine.policy(); }
};

/**
 * @brief Creates a CorsMiddleware from a raw configuration.
 *
 * Intended for server startup: a misconfiguration is fatal there.
 *
 * @param config CORS configuration.
 * @param name Optional name for the middleware.
 * @return A shared pointer to the created CorsMiddleware.
 * @throws std::invalid_argument if the configuration cannot produce a policy.
 */
std::shared_ptr<CorsMiddleware>
cors_middleware(const Config &config, const std::string &name = "CorsMiddleware");

} // namespace qb::cors
