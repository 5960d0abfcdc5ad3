/**
 * @file qbm/cors/headers.h
 * @brief Defines `Headers`, a case-insensitive multi-value HTTP header collection.
 *
 * `Headers` backs the request and response header maps of the in-memory `Exchange`.
 * Lookups ignore the case of header names as required by RFC 7230, Section 3.2,
 * and a single name may carry several values (e.g., several `Vary` entries).
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <cstddef>      // For std::size_t
#include <string>       // For std::string
#include <string_view>  // For std::string_view
#include <vector>       // For std::vector (multiple values per header)

#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map

namespace qb::cors {
    /**
     * @brief Collection of HTTP headers keyed by case-insensitive name.
     */
    class Headers {
    public:
        /** @brief Underlying storage. Keys are case-insensitive header names. */
        using map_type = qb::icase_unordered_map<std::vector<std::string> >;

        Headers() = default;

        /**
         * @brief Gets the value of a header.
         * @param name Header name (case-insensitive).
         * @param index Which value to return when the header appears several times.
         * @param not_found_value Returned when the header or index does not exist.
         * @return The requested value or `not_found_value`.
         */
        [[nodiscard]] std::string
        get(std::string_view name, std::size_t index = 0,
            std::string_view not_found_value = {}) const;

        /** @brief All values of a header, empty when absent. */
        [[nodiscard]] std::vector<std::string>
        values(std::string_view name) const;

        /** @brief Whether at least one value exists for `name`. */
        [[nodiscard]] bool has(std::string_view name) const;

        /** @brief Number of values recorded for `name`. */
        [[nodiscard]] std::size_t count(std::string_view name) const;

        /** @brief Appends a value, keeping existing ones. */
        void add(std::string_view name, std::string value);

        /** @brief Replaces every value of `name` with a single one. */
        void set(std::string_view name, std::string value);

        /** @brief Removes a header and all of its values. */
        void remove(std::string_view name);

        /** @brief Number of distinct header names. */
        [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }

        [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

        void clear() noexcept { _headers.clear(); }

    private:
        map_type _headers;
    };
} // namespace qb::cors
