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
 * @file scru128.hpp
 * @brief Process-wide convenience entry points.
 *
 * @details
 * Most callers only need "give me a fresh identifier". These free functions
 * share one lazily constructed `core::Generator`, created on first use with the
 * system entropy source.
 */

#pragma once

#include "scru128/core/generator.hpp"
#include "scru128/core/id.hpp"

#include <string>

namespace scru128 {

using core::Generator;
using core::Id;

/**
 * @brief Generates a new identifier from the shared default generator.
 *
 * Thread-safe; multiple threads can call it concurrently.
 *
 * @code
 * // Example Usage:
 * scru128::Id id = scru128::new_id();
 * @endcode
 */
Id new_id();

/**
 * @brief Generates a new identifier and returns its 25-digit canonical form.
 *
 * Thread-safe.
 */
std::string new_string();

/// @brief Returns the shared generator behind `new_id()`.
Generator& default_generator();

} // namespace scru128
