/**
 * @file qbm/cors/utility.h
 * @brief String helpers used to normalize CORS configuration and parse probe headers
 *
 * This file provides the small set of string routines the CORS module relies on:
 * case-insensitive comparison, whitespace trimming, list splitting and joining.
 * Header names are compared case-insensitively as required by RFC 7230, Section 3.2.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Cors
 */
#pragma once

#include <algorithm>     // For std::equal, std::transform
#include <cctype>        // For std::tolower
#include <string>        // For std::string
#include <string_view>   // For std::string_view
#include <vector>        // For std::vector

namespace qb::cors {
    /**
     * @brief String utilities for the CORS module.
     */
    namespace utility {
        /**
         * @brief Performs a case-insensitive comparison of two string views.
         * @param a First string view.
         * @param b Second string view.
         * @return `true` if strings are equal ignoring ASCII case, `false` otherwise.
         */
        [[nodiscard]] inline bool
        iequals(std::string_view a, std::string_view b) noexcept {
            return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                              [](char c1, char c2) {
                                  return std::tolower(static_cast<unsigned char>(c1)) ==
                                         std::tolower(static_cast<unsigned char>(c2));
                              });
        }

        /**
         * @brief Checks if a character is HTTP whitespace (Space or Horizontal Tab).
         * @note OWS as defined in RFC 7230, Section 3.2.3.
         */
        [[nodiscard]] inline bool
        is_http_whitespace(char ch) noexcept {
            return ch == ' ' || ch == '\t';
        }

        /**
         * @brief Checks if a character may surround a token in a header list value.
         *
         * Besides OWS this accepts CR and LF, which some clients leave around
         * folded `Access-Control-Request-Headers` values.
         */
        [[nodiscard]] inline bool
        is_token_padding(char ch) noexcept {
            return is_http_whitespace(ch) || ch == '\r' || ch == '\n';
        }

        /**
         * @brief Trims leading and trailing characters matching a predicate.
         * @param sv The string_view to trim.
         * @param pred Predicate returning `true` for characters to strip.
         * @return A view on the trimmed range. Empty if every character matched.
         */
        template<typename Pred>
        [[nodiscard]] std::string_view
        trim_if(std::string_view sv, Pred pred) noexcept {
            std::size_t start = 0;
            std::size_t end = sv.size();
            while (start < end && pred(sv[start]))
                ++start;
            while (end > start && pred(sv[end - 1]))
                --end;
            return sv.substr(start, end - start);
        }

        /** @brief Trims SP and HTAB from both ends. */
        [[nodiscard]] inline std::string_view
        trim_http_whitespace(std::string_view sv) noexcept {
            return trim_if(sv, is_http_whitespace);
        }

        /** @brief Trims SP, HTAB, CR and LF from both ends. */
        [[nodiscard]] inline std::string_view
        trim_token(std::string_view sv) noexcept {
            return trim_if(sv, is_token_padding);
        }

        /**
         * @brief Returns an ASCII-lowercased copy of the input.
         */
        [[nodiscard]] inline std::string
        to_lower(std::string_view sv) {
            std::string result(sv);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        /**
         * @brief Splits a string on a multi-character separator and trims every part.
         *
         * Used for configuration lists written as `"GET, PUT, POST"`. Parts that are
         * empty after trimming are dropped unless `keep_empty` is set, in which case
         * an empty input yields a single empty part.
         *
         * @param str The input list.
         * @param separator The separator, `", "` for configuration lists.
         * @param keep_empty Keep parts that are empty after trimming.
         * @return The trimmed parts in input order.
         *
         * @code
         * auto parts = split_list("GET, POST", ", ");
         * // parts == {"GET", "POST"}
         * @endcode
         */
        [[nodiscard]] inline std::vector<std::string>
        split_list(std::string_view str, std::string_view separator, bool keep_empty = false) {
            std::vector<std::string> result;
            if (separator.empty()) {
                auto whole = trim_http_whitespace(str);
                if (keep_empty || !whole.empty())
                    result.emplace_back(whole);
                return result;
            }

            std::size_t current_pos = 0;
            while (current_pos <= str.size()) {
                const auto next_pos = str.find(separator, current_pos);
                const auto part = trim_http_whitespace(
                    str.substr(current_pos, next_pos == std::string_view::npos
                                                ? std::string_view::npos
                                                : next_pos - current_pos));
                if (keep_empty || !part.empty())
                    result.emplace_back(part);
                if (next_pos == std::string_view::npos)
                    break;
                current_pos = next_pos + separator.size();
            }
            return result;
        }

        /**
         * @brief Splits a header list value on a delimiter character.
         *
         * Each part is trimmed of SP, HTAB, CR and LF. Parts that end up empty are
         * kept, so an empty header value yields a single empty token and a trailing
         * comma yields a trailing empty token.
         *
         * @param header_value The raw header value.
         * @param delimiter The list delimiter, usually `','`.
         */
        [[nodiscard]] inline std::vector<std::string>
        split_and_trim_header_list(std::string_view header_value, char delimiter) {
            std::vector<std::string> result;
            std::string_view remaining = header_value;
            std::size_t pos;
            while ((pos = remaining.find(delimiter)) != std::string_view::npos) {
                result.emplace_back(trim_token(remaining.substr(0, pos)));
                remaining = remaining.substr(pos + 1);
            }
            result.emplace_back(trim_token(remaining));
            return result;
        }

        /**
         * @brief Joins strings with a delimiter.
         * @return The joined string, empty when `strings` is empty.
         */
        [[nodiscard]] inline std::string
        join(const std::vector<std::string> &strings, std::string_view delimiter) {
            std::string result;
            for (std::size_t i = 0; i < strings.size(); ++i) {
                if (i)
                    result.append(delimiter);
                result.append(strings[i]);
            }
            return result;
        }
    } // namespace utility
} // namespace qb::cors
