/**
 * @file qbm/cors/exchange.h
 * @brief Defines the hosting contract between the CORS middleware and an HTTP server.
 *
 * `IExchange` is the only thing the CORS middleware knows about the server it runs
 * in: read access to the request method and headers, write access to the response
 * headers, and a `complete()` primitive to either continue to the next handler or
 * terminate the chain. The request and response bodies are never touched.
 *
 * `Exchange` is a self-contained in-memory implementation, usable by hosts that
 * translate their own request type into it and by tests.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "./cors/decision.h"
#include "./headers.h"
#include "./types.h"

namespace qb::cors {

/**
 * @brief Capabilities the host HTTP layer exposes to the CORS middleware.
 */
class IExchange {
public:
    virtual ~IExchange() = default;

    /** @brief Request method as sent on the wire, e.g. "GET". */
    [[nodiscard]] virtual std::string method() const = 0;

    /**
     * @brief Value of a request header, looked up case-insensitively.
     * @return The first value, or an empty string if absent.
     */
    [[nodiscard]] virtual std::string request_header(std::string_view name) const = 0;

    /** @brief Replaces a response header. */
    virtual void set_header(std::string_view name, std::string value) = 0;

    /** @brief Appends a response header value, keeping existing ones. */
    virtual void add_header(std::string_view name, std::string value) = 0;

    /**
     * @brief Signals that the middleware is done.
     * @param outcome `CONTINUE` to invoke the next handler, `STOP` to terminate the chain.
     */
    virtual void complete(Outcome outcome) = 0;
};

/**
 * @brief Collects the CORS-relevant facts of the request behind an exchange.
 */
[[nodiscard]] RequestFacts read_request_facts(const IExchange &exchange);

/**
 * @brief Writes the headers of a decision to an exchange's response.
 */
void write_decision_headers(const Decision &decision, IExchange &exchange);

/**
 * @brief In-memory `IExchange`.
 *
 * @code
 * auto exchange = std::make_shared<qb::cors::Exchange>("OPTIONS");
 * exchange->request_headers().set("Origin", "https://a.com");
 * exchange->request_headers().set("Access-Control-Request-Method", "PUT");
 * middleware->process(exchange);
 * if (exchange->outcome() == qb::cors::Outcome::STOP) { ... }
 * @endcode
 */
class Exchange : public IExchange {
public:
    using CompletionFn = std::function<void(Outcome)>;

private:
    std::string _method;
    Headers _request_headers;
    Headers _response_headers;
    std::optional<Outcome> _outcome;
    CompletionFn _on_complete;

public:
    explicit Exchange(std::string method = std::string(qb::cors::method::GET))
        : _method(std::move(method)) {}

    Exchange(std::string method, Headers request_headers)
        : _method(std::move(method)), _request_headers(std::move(request_headers)) {}

    [[nodiscard]] std::string method() const override { return _method; }

    [[nodiscard]] std::string request_header(std::string_view name) const override;

    void set_header(std::string_view name, std::string value) override;

    void add_header(std::string_view name, std::string value) override;

    /**
     * @brief Records the outcome and notifies the completion callback.
     * A second call is ignored; the first outcome wins.
     */
    void complete(Outcome outcome) override;

    [[nodiscard]] Headers &request_headers() noexcept { return _request_headers; }
    [[nodiscard]] const Headers &request_headers() const noexcept { return _request_headers; }

    [[nodiscard]] Headers &response_headers() noexcept { return _response_headers; }
    [[nodiscard]] const Headers &response_headers() const noexcept { return _response_headers; }

    /** @brief Outcome reported by the last `complete()`, if any. */
    [[nodiscard]] const std::optional<Outcome> &outcome() const noexcept { return _outcome; }

    [[nodiscard]] bool is_completed() const noexcept { return _outcome.has_value(); }

    /** @brief Forgets the recorded outcome so the exchange can pass through another middleware. */
    void reset_outcome() noexcept { _outcome.reset(); }

    /** @brief Callback invoked from `complete()`, e.g. to resume the host's handler chain. */
    void on_complete(CompletionFn fn) { _on_complete = std::move(fn); }
};

} // namespace qb::cors
