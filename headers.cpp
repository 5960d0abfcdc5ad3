/**
 * @file qbm/cors/headers.cpp
 * @brief Implements the `Headers` collection.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */

#include "./headers.h"

namespace qb::cors {

std::string
Headers::get(std::string_view name, std::size_t index, std::string_view not_found_value) const {
    // icase_unordered_map lookups take an owning key
    const auto it = _headers.find(std::string(name));
    if (it != _headers.cend() && index < it->second.size())
        return it->second[index];
    return std::string(not_found_value);
}

std::vector<std::string>
Headers::values(std::string_view name) const {
    const auto it = _headers.find(std::string(name));
    if (it == _headers.cend())
        return {};
    return it->second;
}

bool
Headers::has(std::string_view name) const {
    return count(name) > 0;
}

std::size_t
Headers::count(std::string_view name) const {
    const auto it = _headers.find(std::string(name));
    return it == _headers.cend() ? 0 : it->second.size();
}

void
Headers::add(std::string_view name, std::string value) {
    _headers[std::string(name)].emplace_back(std::move(value));
}

void
Headers::set(std::string_view name, std::string value) {
    auto &values_vec = _headers[std::string(name)];
    values_vec.clear();
    values_vec.emplace_back(std::move(value));
}

void
Headers::remove(std::string_view name) {
    _headers.erase(std::string(name));
}

} // namespace qb::cors
