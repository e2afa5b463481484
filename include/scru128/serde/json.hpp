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
 * @file json.hpp
 * @brief JSON representation of identifiers, built on cJSON.
 *
 * @details
 * An identifier is written to JSON as its 25-digit canonical string. When
 * reading, three shapes are accepted and all yield the same `Id`:
 * 1. A string holding the 25-digit form (any letter case).
 * 2. An array of 16 integers in `0..255`: the raw big-endian bytes.
 * 3. An array of 25 integers in `0..255`: the UTF-8 bytes of the string form,
 *    as emitted by serializers that encode strings as byte sequences.
 */

#pragma once

#include "scru128/core/id.hpp"

#include <cJSON.h>
#include <optional>
#include <string>

namespace scru128::serde {

/**
 * @brief Creates a JSON string node holding the canonical text form.
 *
 * @warning The caller owns the returned node and must release it with
 * `cJSON_Delete` (or attach it to a parent that is later deleted).
 */
cJSON* to_json(const core::Id& id);

/**
 * @brief Serializes an identifier to JSON text, e.g. `"036z8puq4tsxsigk6o19y164k"`.
 */
std::string to_json_string(const core::Id& id);

/**
 * @brief Decodes an identifier from any of the accepted JSON shapes.
 *
 * @param node A borrowed cJSON node; may be null.
 * @return std::optional<core::Id> The identifier, or `std::nullopt` for any other
 * shape, an out-of-range byte or an invalid digit string.
 */
std::optional<core::Id> from_json(const cJSON* node);

/**
 * @brief Parses JSON text and decodes the identifier it holds.
 *
 * @return std::optional<core::Id> `std::nullopt` on JSON syntax errors or when the
 * document is not an accepted shape.
 */
std::optional<core::Id> from_json_string(const std::string& raw_json);

/**
 * @brief Builds a diagnostic object exposing every field of an identifier.
 *
 * **Object Layout:**
 * @code
 * {
 * "id": "036z8puq4tsxsigk6o19y164k",
 * "timestamp": 1660000000000,
 * "time": "2022-08-08T23:06:40.000Z",
 * "counter_hi": 123,
 * "counter_lo": 456,
 * "entropy": 789
 * }
 * @endcode
 *
 * @warning The caller owns the returned object.
 */
cJSON* describe(const core::Id& id);

} // namespace scru128::serde
