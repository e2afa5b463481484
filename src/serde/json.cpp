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
 * @file json.cpp
 * @brief cJSON-based encoding and decoding of identifiers.
 */

#include "scru128/serde/json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <vector>

namespace scru128::serde {

namespace {

/**
 * @brief Collects an array of small integers as bytes.
 *
 * Fails on any element that is not a number, not integral or not in `0..255`.
 */
std::optional<std::vector<uint8_t>> read_byte_array(const cJSON* array)
{
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(cJSON_GetArraySize(array)));

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array)
    {
        if (!cJSON_IsNumber(item)) {
            return std::nullopt;
        }
        double v = item->valuedouble;
        if (v < 0.0 || v > 255.0 || std::floor(v) != v) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}

/// @brief Formats milliseconds since the epoch as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
std::string format_utc(uint64_t millis)
{
    std::time_t secs = static_cast<std::time_t>(millis / 1000);
    std::tm parts{};
    if (gmtime_r(&secs, &parts) == nullptr) {
        return "";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ", parts.tm_year + 1900,
                  parts.tm_mon + 1, parts.tm_mday, parts.tm_hour, parts.tm_min, parts.tm_sec,
                  static_cast<unsigned>(millis % 1000));
    return std::string(buf);
}

} // namespace

cJSON* to_json(const core::Id& id)
{
    return cJSON_CreateString(id.to_string().c_str());
}

std::string to_json_string(const core::Id& id)
{
    cJSON* node = to_json(id);
    char* raw = cJSON_PrintUnformatted(node);
    std::string out(raw);

    free(raw);
    cJSON_Delete(node);
    return out;
}

std::optional<core::Id> from_json(const cJSON* node)
{
    if (node == nullptr) {
        return std::nullopt;
    }

    if (cJSON_IsString(node)) {
        if (node->valuestring == nullptr) {
            return std::nullopt;
        }
        return core::Id::parse(node->valuestring);
    }

    if (cJSON_IsArray(node)) {
        auto bytes = read_byte_array(node);
        if (!bytes) {
            return std::nullopt;
        }
        if (bytes->size() == core::ID_BYTES) {
            return core::Id::from_bytes(*bytes);
        }
        if (bytes->size() == core::ID_STRING_LENGTH) {
            std::string text(bytes->begin(), bytes->end());
            return core::Id::parse(text);
        }
    }

    return std::nullopt;
}

std::optional<core::Id> from_json_string(const std::string& raw_json)
{
    cJSON* root = cJSON_Parse(raw_json.c_str());
    if (!root) {
        return std::nullopt;
    }
    auto id = from_json(root);
    cJSON_Delete(root);
    return id;
}

cJSON* describe(const core::Id& id)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "id", id.to_string().c_str());
    // 48-bit values are exactly representable as JSON numbers (doubles).
    cJSON_AddNumberToObject(obj, "timestamp", static_cast<double>(id.timestamp()));
    cJSON_AddStringToObject(obj, "time", format_utc(id.timestamp()).c_str());
    cJSON_AddNumberToObject(obj, "counter_hi", id.counter_hi());
    cJSON_AddNumberToObject(obj, "counter_lo", id.counter_lo());
    cJSON_AddNumberToObject(obj, "entropy", id.entropy());
    return obj;
}

} // namespace scru128::serde
