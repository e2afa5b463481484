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
 * @file scru128.cpp
 * @brief Lazily owned default generator.
 */

#include "scru128/scru128.hpp"

namespace scru128 {

Generator& default_generator()
{
    // Function-local static: constructed on first call, thread-safe since C++11.
    static Generator generator;
    return generator;
}

Id new_id()
{
    return default_generator().generate();
}

std::string new_string()
{
    return new_id().to_string();
}

} // namespace scru128
