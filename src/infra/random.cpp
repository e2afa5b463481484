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
 * @file random.cpp
 * @brief OS-backed implementation of `RandomSource`.
 */

#include "scru128/infra/random.hpp"

namespace scru128::infra {

/**
 * @brief Draws one 32-bit word from the system entropy device.
 *
 * `std::random_device::result_type` is `unsigned int`, which is at least 32
 * bits wide on every supported target; the uniform distribution normalizes
 * the range regardless.
 */
uint32_t SystemRandom::next_u32()
{
    std::uniform_int_distribution<uint32_t> dis;
    return dis(device_);
}

} // namespace scru128::infra
