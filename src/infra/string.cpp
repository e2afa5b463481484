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
 * @file string.cpp
 * @brief Implementation of the text helpers.
 *
 * @note Every character is cast to `unsigned char` before `std::isspace` to
 * avoid undefined behaviour with negative `char` values (UTF-8 bytes).
 */

#include "scru128/infra/string.hpp"

#include <cctype>

namespace scru128::infra {

namespace {

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string String::trim(std::string_view s)
{
    std::size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) {
        ++begin;
    }

    std::size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }

    return std::string(s.substr(begin, end - begin));
}

std::vector<std::string> String::split_whitespace(std::string_view s)
{
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) {
            ++i;
        }
        std::size_t start = i;
        while (i < s.size() && !is_space(s[i])) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(s.substr(start, i - start));
        }
    }
    return tokens;
}

} // namespace scru128::infra
