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
 * @file random.hpp
 * @brief Entropy sources consumed by the identifier generator.
 *
 * @details
 * The generator never reaches for a global random engine. It owns a
 * `RandomSource` handed to it at construction, which lets tests substitute a
 * scripted sequence and makes counter-overflow paths reproducible.
 */

#pragma once

#include <cstdint>
#include <random>

namespace scru128::infra {

/**
 * @class RandomSource
 * @brief Abstract producer of uniformly distributed 32-bit words.
 *
 * @details
 * Implementations are not required to be thread-safe. The generator only calls
 * `next_u32()` while holding its own lock.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /// @brief Returns the next uniformly distributed 32-bit value.
    virtual uint32_t next_u32() = 0;
};

/**
 * @class SystemRandom
 * @brief `RandomSource` backed by the operating system's entropy pool.
 *
 * @details
 * Every word is drawn straight from `std::random_device`, which on Linux reads
 * the kernel CSPRNG (`getrandom`/`/dev/urandom`). No user-space engine is
 * seeded from it, so successive values are not predictable from earlier ones.
 */
class SystemRandom : public RandomSource {
  public:
    SystemRandom() = default;

    uint32_t next_u32() override;

  private:
    std::random_device device_;
};

} // namespace scru128::infra
