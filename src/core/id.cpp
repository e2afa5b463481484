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
 * @file id.cpp
 * @brief Field packing, accessors and text conversion for `Id`.
 */

#include "scru128/core/id.hpp"

#include "scru128/core/error.hpp"

namespace scru128::core {

/**
 * @brief Packs the four fields MSB-first into 16 bytes.
 *
 * Every argument is range-checked before any byte is written, so an out of
 * range field never produces a silently truncated identifier.
 */
Id Id::from_fields(uint64_t timestamp, uint32_t counter_hi, uint32_t counter_lo,
                   uint32_t entropy)
{
    if (timestamp > MAX_TIMESTAMP) {
        throw RangeError("timestamp exceeds 48 bits: " + std::to_string(timestamp));
    }
    if (counter_hi > MAX_COUNTER_HI) {
        throw RangeError("counter_hi exceeds 24 bits: " + std::to_string(counter_hi));
    }
    if (counter_lo > MAX_COUNTER_LO) {
        throw RangeError("counter_lo exceeds 24 bits: " + std::to_string(counter_lo));
    }

    Bytes b{};
    b[0] = static_cast<uint8_t>(timestamp >> 40);
    b[1] = static_cast<uint8_t>(timestamp >> 32);
    b[2] = static_cast<uint8_t>(timestamp >> 24);
    b[3] = static_cast<uint8_t>(timestamp >> 16);
    b[4] = static_cast<uint8_t>(timestamp >> 8);
    b[5] = static_cast<uint8_t>(timestamp);
    b[6] = static_cast<uint8_t>(counter_hi >> 16);
    b[7] = static_cast<uint8_t>(counter_hi >> 8);
    b[8] = static_cast<uint8_t>(counter_hi);
    b[9] = static_cast<uint8_t>(counter_lo >> 16);
    b[10] = static_cast<uint8_t>(counter_lo >> 8);
    b[11] = static_cast<uint8_t>(counter_lo);
    b[12] = static_cast<uint8_t>(entropy >> 24);
    b[13] = static_cast<uint8_t>(entropy >> 16);
    b[14] = static_cast<uint8_t>(entropy >> 8);
    b[15] = static_cast<uint8_t>(entropy);
    return Id(b);
}

Id Id::from_bytes(const Bytes& bytes)
{
    return Id(bytes);
}

Id Id::from_bytes(const uint8_t* data, std::size_t size)
{
    if (size != ID_BYTES) {
        throw RangeError("expected " + std::to_string(ID_BYTES) + " bytes, got " +
                         std::to_string(size));
    }
    Bytes b{};
    for (std::size_t i = 0; i < ID_BYTES; ++i) {
        b[i] = data[i];
    }
    return Id(b);
}

Id Id::from_bytes(const std::vector<uint8_t>& bytes)
{
    return from_bytes(bytes.data(), bytes.size());
}

std::optional<Id> Id::parse(std::string_view text)
{
    auto decoded = base36::decode(text);
    if (!decoded) {
        return std::nullopt;
    }
    return Id(*decoded);
}

Id Id::from_string(std::string_view text)
{
    auto id = parse(text);
    if (!id) {
        throw ParseError("invalid identifier string: '" + std::string(text) + "'");
    }
    return *id;
}

std::string Id::to_string() const
{
    return base36::encode(bytes_);
}

uint64_t Id::read_uint(std::size_t begin, std::size_t end) const
{
    uint64_t value = 0;
    for (std::size_t i = begin; i < end; ++i) {
        value = (value << 8) | bytes_[i];
    }
    return value;
}

uint64_t Id::timestamp() const
{
    return read_uint(0, 6);
}

uint32_t Id::counter_hi() const
{
    return static_cast<uint32_t>(read_uint(6, 9));
}

uint32_t Id::counter_lo() const
{
    return static_cast<uint32_t>(read_uint(9, 12));
}

uint32_t Id::entropy() const
{
    return static_cast<uint32_t>(read_uint(12, 16));
}

std::ostream& operator<<(std::ostream& os, const Id& id)
{
    return os << id.to_string();
}

} // namespace scru128::core

namespace std {

std::size_t hash<scru128::core::Id>::operator()(const scru128::core::Id& id) const noexcept
{
    const auto& b = id.bytes();
    uint64_t hi = 0;
    uint64_t lo = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        hi = (hi << 8) | b[i];
        lo = (lo << 8) | b[i + 8];
    }
    // Boost-style combine keeps the result sensitive to both halves.
    std::size_t seed = std::hash<uint64_t>{}(hi);
    seed ^= std::hash<uint64_t>{}(lo) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

} // namespace std
