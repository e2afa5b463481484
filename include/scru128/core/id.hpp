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
 * @file id.hpp
 * @brief The 128-bit time-ordered identifier value type.
 *
 * @details
 * An `Id` is 16 immutable bytes holding four big-endian fields packed from the
 * most significant bit downwards:
 *
 * | Field        | Bits | Bytes     |
 * |--------------|------|-----------|
 * | `timestamp`  | 48   | [0, 6)    |
 * | `counter_hi` | 24   | [6, 9)    |
 * | `counter_lo` | 24   | [9, 12)   |
 * | `entropy`    | 32   | [12, 16)  |
 *
 * Because the layout is big-endian, byte-wise comparison, 128-bit unsigned
 * comparison and field-tuple comparison all agree.
 */

#pragma once

#include "scru128/core/base36.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace scru128::core {

/// Maximum value of the 48-bit `timestamp` field.
constexpr uint64_t MAX_TIMESTAMP = 0xffff'ffff'ffffULL;

/// Maximum value of the 24-bit `counter_hi` field.
constexpr uint32_t MAX_COUNTER_HI = 0xff'ffff;

/// Maximum value of the 24-bit `counter_lo` field.
constexpr uint32_t MAX_COUNTER_LO = 0xff'ffff;

/// Size of the binary form.
constexpr std::size_t ID_BYTES = base36::BYTE_LENGTH;

/// Size of the canonical text form.
constexpr std::size_t ID_STRING_LENGTH = base36::DIGIT_LENGTH;

/**
 * @class Id
 * @brief A 128-bit identifier with a 25-digit Base36 text form.
 *
 * @details
 * Instances are only created through the static factories, so every `Id` in
 * existence is fully initialized. The default constructor yields the all-zero
 * identifier.
 */
class Id {
  public:
    using Bytes = base36::Bytes;

    /// @brief Constructs the all-zero identifier.
    Id() = default;

    /**
     * @brief Builds an identifier from its four field values.
     *
     * @param timestamp 48-bit `timestamp` field value.
     * @param counter_hi 24-bit `counter_hi` field value.
     * @param counter_lo 24-bit `counter_lo` field value.
     * @param entropy 32-bit `entropy` field value.
     * @return Id The packed identifier.
     *
     * @throws RangeError If any argument does not fit its field.
     */
    static Id from_fields(uint64_t timestamp, uint32_t counter_hi, uint32_t counter_lo,
                          uint32_t entropy);

    /// @brief Wraps a 16-byte big-endian array. Every bit pattern is valid.
    static Id from_bytes(const Bytes& bytes);

    /**
     * @brief Wraps a big-endian byte buffer of unchecked length.
     *
     * @throws RangeError If `size` is not 16.
     */
    static Id from_bytes(const uint8_t* data, std::size_t size);

    /// @overload
    static Id from_bytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decodes the 25-digit Base36 text form (case-insensitive).
     *
     * @param text Untrusted input.
     * @return std::optional<Id> The identifier, or `std::nullopt` if the input has
     * the wrong length, contains a non-digit byte or exceeds 128 bits.
     *
     * @code
     * // Example Usage:
     * auto id = scru128::core::Id::parse("036z8puq4tsxsigk6o19y164k");
     * if (!id) { ... }
     * @endcode
     */
    static std::optional<Id> parse(std::string_view text);

    /**
     * @brief Throwing variant of `parse`.
     *
     * @throws ParseError If the text is not a valid identifier.
     */
    static Id from_string(std::string_view text);

    /// @brief Returns the 25-digit lowercase canonical text form.
    std::string to_string() const;

    /// @brief Returns the 16-byte big-endian binary form.
    const Bytes& bytes() const { return bytes_; }

    uint64_t timestamp() const;
    uint32_t counter_hi() const;
    uint32_t counter_lo() const;
    uint32_t entropy() const;

    friend bool operator==(const Id& lhs, const Id& rhs) { return lhs.bytes_ == rhs.bytes_; }
    friend bool operator!=(const Id& lhs, const Id& rhs) { return lhs.bytes_ != rhs.bytes_; }

    // std::array compares lexicographically, which is unsigned big-endian order.
    friend bool operator<(const Id& lhs, const Id& rhs) { return lhs.bytes_ < rhs.bytes_; }
    friend bool operator>(const Id& lhs, const Id& rhs) { return rhs < lhs; }
    friend bool operator<=(const Id& lhs, const Id& rhs) { return !(rhs < lhs); }
    friend bool operator>=(const Id& lhs, const Id& rhs) { return !(lhs < rhs); }

  private:
    explicit Id(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Reads bytes `[begin, end)` as a big-endian unsigned integer.
    uint64_t read_uint(std::size_t begin, std::size_t end) const;

    Bytes bytes_{};
};

/// @brief Streams the canonical text form.
std::ostream& operator<<(std::ostream& os, const Id& id);

} // namespace scru128::core

namespace std {

/// @brief Hash over the 16 bytes, folded as two 64-bit halves.
template <> struct hash<scru128::core::Id> {
    std::size_t operator()(const scru128::core::Id& id) const noexcept;
};

} // namespace std
