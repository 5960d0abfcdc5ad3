/**
 * @file qbm/cors/cors/matchers.cpp
 * @brief Implements the CORS matchers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./matchers.h"

#include <algorithm>

#include "../utility.h"

namespace qb::cors::match {

bool
origin(std::string_view origin, const std::vector<std::string> &allowed) noexcept {
    return std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

bool
method(std::string_view method, const std::vector<std::string> &allowed) noexcept {
    if (method.empty())
        return false;
    return std::find(allowed.begin(), allowed.end(), method) != allowed.end();
}

bool
headers(std::string_view requested, const std::vector<std::string> &allowed_lowercase) {
    const auto tokens = utility::split_and_trim_header_list(requested, ',');
    return std::all_of(tokens.begin(), tokens.end(), [&](const std::string &token) {
        return std::any_of(allowed_lowercase.begin(), allowed_lowercase.end(),
                           [&](const std::string &name) { return utility::iequals(token, name); });
    });
}

} // namespace qb::cors::match
