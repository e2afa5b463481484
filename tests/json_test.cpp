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
 * @file json_test.cpp
 * @brief Tests for the cJSON serialized-object form.
 *
 * @details
 * Verifies that the three accepted JSON shapes (string, raw byte array,
 * string-bytes array) decode to one identical `Id`, and that every other shape
 * is rejected.
 */

#include "scru128/core/id.hpp"
#include "scru128/serde/json.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <string>

using scru128::core::Id;

namespace {

const char* SAMPLE = "036z8puq4tsxsigk6o19y164k";

/// @brief Renders a byte sequence as a JSON array of numbers.
template <typename Container> std::string as_json_array(const Container& bytes)
{
    std::string out = "[";
    bool first = true;
    for (auto b : bytes) {
        if (!first) {
            out += ",";
        }
        out += std::to_string(static_cast<unsigned>(static_cast<unsigned char>(b)));
        first = false;
    }
    return out + "]";
}

} // namespace

/**
 * @brief Encodes to the 25-digit string and reads it back.
 */
void test_json_encode_as_string()
{
    Id id = Id::from_string(SAMPLE);
    ASSERT_EQ(scru128::serde::to_json_string(id), "\"" + std::string(SAMPLE) + "\"");

    cJSON* node = scru128::serde::to_json(id);
    ASSERT_TRUE(cJSON_IsString(node));
    ASSERT_EQ(std::string(node->valuestring), std::string(SAMPLE));
    auto back = scru128::serde::from_json(node);
    cJSON_Delete(node);

    ASSERT_TRUE(back.has_value());
    ASSERT_EQ(*back, id);
}

/**
 * @brief String, raw-byte and string-byte arrays all decode to the same value.
 */
void test_json_decode_accepted_shapes()
{
    Id id = Id::from_string(SAMPLE);

    auto from_string = scru128::serde::from_json_string("\"036Z8PUQ4TSXSIGK6O19Y164K\"");
    auto from_bytes = scru128::serde::from_json_string(as_json_array(id.bytes()));
    auto from_text_bytes = scru128::serde::from_json_string(as_json_array(std::string(SAMPLE)));

    ASSERT_TRUE(from_string.has_value());
    ASSERT_TRUE(from_bytes.has_value());
    ASSERT_TRUE(from_text_bytes.has_value());
    ASSERT_EQ(*from_string, id);
    ASSERT_EQ(*from_bytes, id);
    ASSERT_EQ(*from_text_bytes, id);
}

/**
 * @brief Any other JSON shape is a decode error, never a crash.
 */
void test_json_decode_rejects_other_shapes()
{
    using scru128::serde::from_json_string;

    ASSERT_FALSE(scru128::serde::from_json(nullptr).has_value());
    ASSERT_FALSE(from_json_string("").has_value());
    ASSERT_FALSE(from_json_string("{not json").has_value());
    ASSERT_FALSE(from_json_string("null").has_value());
    ASSERT_FALSE(from_json_string("true").has_value());
    ASSERT_FALSE(from_json_string("42").has_value());
    ASSERT_FALSE(from_json_string("{\"id\":\"036z8puq4tsxsigk6o19y164k\"}").has_value());
    ASSERT_FALSE(from_json_string("\"036z8puq4tsxsigk6o19y164\"").has_value());
    ASSERT_FALSE(from_json_string("\"zzzzzzzzzzzzzzzzzzzzzzzzz\"").has_value());
    ASSERT_FALSE(from_json_string("[]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,256]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,-1]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,1.5]").has_value());
    ASSERT_FALSE(from_json_string("[0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,\"0\"]").has_value());

    // 25 numbers that are not Base36 digit characters.
    std::string spaces(25, ' ');
    ASSERT_FALSE(from_json_string(as_json_array(spaces)).has_value());
}

/**
 * @brief The diagnostic object exposes every field.
 */
void test_json_describe_fields()
{
    Id id = Id::from_fields(1'660'000'000'123ULL, 0xabcdef, 0x123456, 0xdeadbeef);
    cJSON* obj = scru128::serde::describe(id);

    cJSON* text = cJSON_GetObjectItem(obj, "id");
    cJSON* ts = cJSON_GetObjectItem(obj, "timestamp");
    cJSON* time = cJSON_GetObjectItem(obj, "time");
    cJSON* hi = cJSON_GetObjectItem(obj, "counter_hi");
    cJSON* lo = cJSON_GetObjectItem(obj, "counter_lo");
    cJSON* entropy = cJSON_GetObjectItem(obj, "entropy");

    ASSERT_TRUE(text && ts && time && hi && lo && entropy);
    ASSERT_EQ(std::string(text->valuestring), id.to_string());
    ASSERT_EQ(static_cast<uint64_t>(ts->valuedouble), id.timestamp());
    ASSERT_EQ(std::string(time->valuestring), std::string("2022-08-08T23:06:40.123Z"));
    ASSERT_EQ(static_cast<uint32_t>(hi->valuedouble), id.counter_hi());
    ASSERT_EQ(static_cast<uint32_t>(lo->valuedouble), id.counter_lo());
    ASSERT_EQ(static_cast<uint32_t>(entropy->valuedouble), id.entropy());

    cJSON_Delete(obj);
}
