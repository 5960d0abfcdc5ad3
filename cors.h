/**
 * @file qbm/cors/cors.h
 * @brief Main interface of the qb CORS module
 *
 * Cross-Origin Resource Sharing policy enforcement for HTTP servers:
 *
 * - `Config`: raw configuration, defaults and JSON loading
 * - `PolicyBuilder` / `Policy`: immutable normalized rules, built once at startup
 * - `Engine`: the per-request decision pipeline
 * - `IExchange` / `Exchange`: the hosting contract
 * - `CorsMiddleware` / `MiddlewareChain`: handler chain integration
 *
 * @code
 * #include <qbm/cors/cors.h>
 *
 * auto config = qb::cors::Config::defaults();
 * config.origins = "https://app.example.com";
 * auto cors = qb::cors::cors_middleware(config); // throws on misconfiguration
 *
 * qb::cors::MiddlewareChain chain;
 * chain.use(cors).handler([](auto exchange) { ... });
 * chain.run(exchange);
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#ifndef QB_MODULE_CORS_H_
#define QB_MODULE_CORS_H_
#include "./types.h"
#include "./utility.h"
#include "./headers.h"
#include "./cors/result.h"
#include "./cors/config.h"
#include "./cors/matchers.h"
#include "./cors/policy.h"
#include "./cors/decision.h"
#include "./cors/engine.h"
#include "./exchange.h"
#include "./middleware/middleware_interface.h"
#include "./middleware/middleware_chain.h"
#include "./middleware/cors.h"
#endif // QB_MODULE_CORS_H_
