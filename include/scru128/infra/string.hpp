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
 * @brief Text helpers for reading identifiers from line-oriented input.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scru128::infra {

/**
 * @class String
 * @brief A static container for stateless text processing.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace.
     *
     * Whitespace is whatever `std::isspace` accepts in the "C" locale: space,
     * `\t`, `\n`, `\v`, `\f` and `\r`.
     *
     * @param s The source text.
     * @return std::string The trimmed copy; empty if `s` is blank.
     */
    static std::string trim(std::string_view s);

    /**
     * @brief Splits text into whitespace-separated tokens.
     *
     * Runs of whitespace count as one separator and never produce empty
     * tokens, so `"  a \t b\n"` yields `{"a", "b"}`.
     *
     * @code
     * // Example Usage:
     * for (const auto& token : String::split_whitespace(line)) { ... }
     * @endcode
     */
    static std::vector<std::string> split_whitespace(std::string_view s);
};

} // namespace scru128::infra
