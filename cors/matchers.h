/**
 * @file qbm/cors/cors/matchers.h
 * @brief Origin, method and header-list matching used by the CORS decision pipeline.
 *
 * Origins and methods are matched case-sensitively, byte for byte, with no
 * wildcard sub-matching and no scheme/port normalization. Header names are
 * matched case-insensitively (RFC 7230, Section 3.2).
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

namespace qb::cors::match {

/**
 * @brief Exact, case-sensitive origin lookup.
 * @param origin Value of the request's `Origin` header.
 * @param allowed Configured origins.
 * @return true if `origin` equals one of `allowed`.
 */
[[nodiscard]] bool origin(std::string_view origin, const std::vector<std::string> &allowed) noexcept;

/**
 * @brief Exact, case-sensitive method lookup.
 * @param method Probed method (`Access-Control-Request-Method`).
 * @param allowed Configured methods.
 * @return true if `method` is non-empty and equals one of `allowed`.
 */
[[nodiscard]] bool method(std::string_view method, const std::vector<std::string> &allowed) noexcept;

/**
 * @brief Checks that every header of a probed list is allowed.
 *
 * `requested` is the raw `Access-Control-Request-Headers` value. It is split on
 * commas, each token is trimmed of SP/HTAB/CR/LF and must then appear in
 * `allowed_lowercase`, ignoring case. Empty tokens are kept: an empty value or a
 * trailing comma only matches when the allowed set holds an empty name.
 *
 * @param requested Raw comma separated header list.
 * @param allowed_lowercase Configured header names, already lowercased.
 * @return true if the list is a subset of the allowed set.
 */
[[nodiscard]] bool headers(std::string_view requested, const std::vector<std::string> &allowed_lowercase);

} // namespace qb::cors::match
