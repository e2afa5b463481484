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
 * @file error.hpp
 * @brief Exception types raised by the identifier core.
 *
 * @details
 * Two failure classes exist. A `RangeError` marks a broken precondition (a field
 * value wider than its slot, a byte buffer of the wrong length, a generator
 * timestamp outside the 48-bit domain). A `ParseError` marks untrusted text that
 * does not decode to an identifier; it is only thrown by the explicit throwing
 * helpers, the primary parse path reports failure through `std::optional`.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace scru128::core {

/**
 * @class RangeError
 * @brief Raised when an argument lies outside the domain of its field.
 *
 * The operation that raises it has not modified any state.
 */
class RangeError : public std::out_of_range {
  public:
    explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};

/**
 * @class ParseError
 * @brief Raised when text cannot be decoded into an identifier.
 */
class ParseError : public std::invalid_argument {
  public:
    explicit ParseError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace scru128::core
