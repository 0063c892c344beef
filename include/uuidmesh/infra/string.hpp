/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` holding the text processing needed by the HTTP codec
 * (header trimming, case folding, percent-decoding, path splitting) and the
 * configuration loaders.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace uuidmesh::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string instance containing the trimmed content.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = uuidmesh::infra::String::trim("  Host: x \r\n"); // "Host: x"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-casing, used for case-insensitive header names.
    static std::string to_lower(const std::string& s);

    /// @brief Case-insensitive ASCII comparison.
    static bool iequals(const std::string& a, const std::string& b);

    /**
     * @brief Splits on a delimiter, keeping empty fields.
     *
     * `split("a//b", '/')` yields `{"a", "", "b"}`.
     */
    static std::vector<std::string> split(const std::string& s, char delim);

    /// @brief True if `s` begins with `prefix`.
    static bool starts_with(const std::string& s, const std::string& prefix);

    /// @brief True if `s` ends with `suffix`.
    static bool ends_with(const std::string& s, const std::string& suffix);

    /**
     * @brief Decodes `%XX` escapes. When `plus_as_space` is set, `+` becomes a space
     * (query-string semantics).
     *
     * @return The decoded text, or `std::nullopt` on a truncated or non-hex escape.
     */
    static std::optional<std::string> url_decode(const std::string& s, bool plus_as_space);

    /**
     * @brief Parses a non-negative decimal integer occupying the whole string.
     * @return The value, or `std::nullopt` for empty, signed, overflowing or non-digit input.
     */
    static std::optional<long long> parse_uint(const std::string& s);
};

} // namespace uuidmesh::infra
