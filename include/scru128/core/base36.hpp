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
 * @file base36.hpp
 * @brief Fixed-width Base36 <-> Base256 conversion for 128-bit values.
 *
 * @details
 * These functions are independent of the `Id` type. They convert between a
 * 16-byte big-endian unsigned integer and its 25-digit Base36 text form using
 * schoolbook multiply-accumulate over fixed buffers, bounding every
 * intermediate product to a 64-bit word.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scru128::core::base36 {

/// Number of raw bytes in a 128-bit value.
constexpr std::size_t BYTE_LENGTH = 16;

/// Number of Base36 digits needed to hold any 128-bit value.
constexpr std::size_t DIGIT_LENGTH = 25;

/// Canonical (lowercase) digit alphabet.
constexpr std::string_view DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";

using Bytes = std::array<uint8_t, BYTE_LENGTH>;

/**
 * @brief Encodes a 128-bit big-endian value as 25 lowercase Base36 digits.
 *
 * The output is left-padded with `'0'` so that its length is always exactly
 * `DIGIT_LENGTH`, which keeps lexicographic and numeric order aligned.
 *
 * @param bytes The value in big-endian (network) byte order.
 * @return std::string A 25-character string over `DIGITS`.
 *
 * @code
 * // Example Usage:
 * base36::Bytes zero{};
 * std::string s = base36::encode(zero); // "0000000000000000000000000"
 * @endcode
 */
std::string encode(const Bytes& bytes);

/**
 * @brief Decodes 25 Base36 digits (any letter case) into a 128-bit value.
 *
 * **Rejected Inputs:**
 * - Any length other than 25 bytes.
 * - Any byte that is not `0-9`, `a-z` or `A-Z` (including non-ASCII bytes).
 * - Any digit string whose magnitude exceeds 2^128 - 1.
 *
 * @param text The candidate digit string.
 * @return std::optional<Bytes> The big-endian value, or `std::nullopt` on failure.
 */
std::optional<Bytes> decode(std::string_view text);

} // namespace scru128::core::base36
