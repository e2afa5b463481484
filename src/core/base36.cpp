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
 * @file base36.cpp
 * @brief Implementation of the fixed-width Base36 codec.
 *
 * @details
 * Both directions are the classic big-integer radix conversion. The source is
 * consumed in chunks small enough that `chunk_value + digit * radix^chunk`
 * always fits in 64 bits:
 * - **Encode**: 56-bit words of the byte array (2 + 7 + 7 bytes) are folded
 *   into the digit buffer, whose existing digits are scaled by 2^56.
 * - **Decode**: groups of up to 10 digits (5 + 10 + 10) are folded into the
 *   byte buffer, whose existing bytes are scaled by 36^10.
 */

#include "scru128/core/base36.hpp"

namespace scru128::core::base36 {

namespace {

/// 36^10, the scale factor applied per 10-digit decode group.
constexpr uint64_t RADIX_POW_10 = 3'656'158'440'062'976ULL;

/// Marker for bytes that are not Base36 digits.
constexpr uint8_t INVALID_DIGIT = 0xff;

/**
 * @brief Builds the ASCII -> digit-value lookup table at compile time.
 *
 * Upper and lower case letters map to the same value. Every byte outside
 * `0-9A-Za-z`, including the whole 0x80-0xff range, maps to `INVALID_DIGIT`.
 */
constexpr std::array<uint8_t, 256> make_decode_map()
{
    std::array<uint8_t, 256> map{};
    for (auto& v : map) {
        v = INVALID_DIGIT;
    }
    for (uint8_t i = 0; i < 10; ++i) {
        map['0' + i] = i;
    }
    for (uint8_t i = 0; i < 26; ++i) {
        map['a' + i] = static_cast<uint8_t>(10 + i);
        map['A' + i] = static_cast<uint8_t>(10 + i);
    }
    return map;
}

constexpr std::array<uint8_t, 256> DECODE_MAP = make_decode_map();

/**
 * @brief Reads bytes `[begin, end)` as a big-endian unsigned integer.
 */
uint64_t read_word(const Bytes& bytes, int begin, int end)
{
    uint64_t word = 0;
    for (int i = begin; i < end; ++i) {
        word = (word << 8) | bytes[static_cast<std::size_t>(i)];
    }
    return word;
}

} // namespace

std::string encode(const Bytes& bytes)
{
    std::array<uint8_t, DIGIT_LENGTH> dst{};

    // Lowest digit index written so far; starts past the end of the buffer.
    int min_index = static_cast<int>(DIGIT_LENGTH);

    for (int i = -5; i < static_cast<int>(BYTE_LENGTH); i += 7) {
        uint64_t carry = read_word(bytes, i < 0 ? 0 : i, i + 7);

        // Scale every digit already written by 2^56 and add the new word,
        // walking right to left until both the carry and the filled region end.
        int j = static_cast<int>(DIGIT_LENGTH) - 1;
        while (carry > 0 || j > min_index) {
            carry += static_cast<uint64_t>(dst[static_cast<std::size_t>(j)]) << 56;
            dst[static_cast<std::size_t>(j)] = static_cast<uint8_t>(carry % 36);
            carry /= 36;
            --j;
        }
        min_index = j;
    }

    std::string text(DIGIT_LENGTH, '0');
    for (std::size_t i = 0; i < DIGIT_LENGTH; ++i) {
        text[i] = DIGITS[dst[i]];
    }
    return text;
}

std::optional<Bytes> decode(std::string_view text)
{
    if (text.size() != DIGIT_LENGTH) {
        return std::nullopt;
    }

    std::array<uint8_t, DIGIT_LENGTH> src{};
    for (std::size_t i = 0; i < DIGIT_LENGTH; ++i) {
        src[i] = DECODE_MAP[static_cast<unsigned char>(text[i])];
        if (src[i] == INVALID_DIGIT) {
            return std::nullopt;
        }
    }

    Bytes dst{};
    int min_index = static_cast<int>(BYTE_LENGTH);

    for (int i = -5; i < static_cast<int>(DIGIT_LENGTH); i += 10) {
        uint64_t carry = 0;
        for (int k = (i < 0 ? 0 : i); k < i + 10; ++k) {
            carry = carry * 36 + src[static_cast<std::size_t>(k)];
        }

        int j = static_cast<int>(BYTE_LENGTH) - 1;
        while (carry > 0 || j > min_index) {
            // A carry that survives past byte 0 means the value needs more
            // than 128 bits.
            if (j < 0) {
                return std::nullopt;
            }
            carry += static_cast<uint64_t>(dst[static_cast<std::size_t>(j)]) * RADIX_POW_10;
            dst[static_cast<std::size_t>(j)] = static_cast<uint8_t>(carry);
            carry >>= 8;
            --j;
        }
        min_index = j;
    }

    return dst;
}

} // namespace scru128::core::base36
