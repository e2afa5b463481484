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
 * @file generator.hpp
 * @brief Monotonic, clock-driven identifier generator.
 *
 * @details
 * This file declares the `Generator` class, the stateful half of the library.
 * It turns millisecond timestamps and random input into identifiers that are
 * strictly increasing for a single instance, even when many identifiers are
 * requested within one millisecond or the wall clock steps backwards by a small
 * amount.
 */

#pragma once

#include "scru128/core/id.hpp"
#include "scru128/infra/random.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace scru128::core {

/// Backward clock jump (ms) that `generate()` absorbs without resetting.
constexpr uint64_t DEFAULT_ROLLBACK_ALLOWANCE = 10'000;

/**
 * @class Generator
 * @brief Produces increasing `Id` values from time, counters and entropy.
 *
 * @details
 * **State Machine:**
 * - A timestamp newer than the last one opens a new window: `counter_lo` is
 *   re-randomized.
 * - A timestamp that is equal, or older by less than the rollback allowance,
 *   advances `counter_lo`, carrying into `counter_hi` and then into the
 *   timestamp itself.
 * - An older timestamp beyond the allowance either resets the generator
 *   (`generate_or_reset_core`) or is refused (`generate_or_abort_core`).
 * - `counter_hi` is re-randomized at most once per second of generator time.
 *
 * **Concurrency Model:**
 * - `generate()` and `generate_or_abort()` serialize on an internal mutex and
 *   may be called from any number of threads.
 * - The `*_core` functions take no lock. The caller must guarantee exclusive
 *   access (for example, one generator per thread). Mixing them with the
 *   locked functions across threads is undefined.
 */
class Generator {
  public:
    /**
     * @enum Status
     * @brief The branch taken by the most recent successful generation.
     */
    enum class Status {
        NOT_EXECUTED,  ///< No identifier has been produced yet.
        NEW_TIMESTAMP, ///< The timestamp moved forward; `counter_lo` re-randomized.
        COUNTER_LO_INC, ///< Same window; `counter_lo` incremented.
        COUNTER_HI_INC, ///< `counter_lo` overflowed into `counter_hi`.
        TIMESTAMP_INC, ///< Both counters overflowed; timestamp advanced by 1 ms.
        CLOCK_ROLLBACK ///< Clock regressed beyond the allowance; state was reset.
    };

    /// @brief Creates a generator drawing from the system entropy device.
    Generator();

    /**
     * @brief Creates a generator with a caller-supplied random source.
     *
     * The source should be cryptographically strong and securely seeded in
     * production. Tests may pass a deterministic fake.
     *
     * @param rng Owned source; must not be null.
     */
    explicit Generator(std::unique_ptr<infra::RandomSource> rng);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief Generates an identifier from the current system time.
     *
     * Resets the state if the clock moved back by more than
     * `DEFAULT_ROLLBACK_ALLOWANCE`, trading monotonicity for availability.
     * Thread-safe.
     */
    Id generate();

    /**
     * @brief Generates an identifier from the current system time, refusing to
     * go backwards.
     *
     * @return std::optional<Id> `std::nullopt` if the clock moved back by more
     * than `DEFAULT_ROLLBACK_ALLOWANCE`; the generator state is then unchanged.
     * Thread-safe.
     */
    std::optional<Id> generate_or_abort();

    /**
     * @brief Unlocked core that resets the state on a significant rollback.
     *
     * @param timestamp Milliseconds since the Unix epoch, in `1 .. MAX_TIMESTAMP`.
     * @param rollback_allowance Tolerated backward jump in ms, at most `MAX_TIMESTAMP`.
     * @return Id The next identifier.
     *
     * @throws RangeError If an argument is outside its domain. State is untouched.
     * @warning Not thread-safe.
     */
    Id generate_or_reset_core(uint64_t timestamp, uint64_t rollback_allowance);

    /**
     * @brief Unlocked core that refuses to go backwards on a significant rollback.
     *
     * @return std::optional<Id> `std::nullopt` when
     * `timestamp + rollback_allowance <= last timestamp`; state is untouched.
     *
     * @throws RangeError If an argument is outside its domain. State is untouched.
     * @warning Not thread-safe.
     */
    std::optional<Id> generate_or_abort_core(uint64_t timestamp, uint64_t rollback_allowance);

    /// @brief Branch taken by the last successful call. Not synchronized.
    Status last_status() const { return last_status_; }

  private:
    /**
     * @brief Shared state transition for both cores.
     *
     * Applies steps "new window" or "advance counters" when the timestamp is
     * within the allowance and returns `true`; returns `false` without touching
     * anything when the clock regressed beyond it.
     */
    bool advance(uint64_t timestamp, uint64_t rollback_allowance);

    /// @brief Opens a new time window at `timestamp`.
    void open_window(uint64_t timestamp);

    /// @brief Refreshes `counter_hi` if a second has elapsed, then packs the Id.
    Id emit();

    /// @brief Next 24-bit random value.
    uint32_t next_u24();

    static void check_arguments(uint64_t timestamp, uint64_t rollback_allowance);

    uint64_t timestamp_ = 0;
    uint32_t counter_hi_ = 0;
    uint32_t counter_lo_ = 0;

    /// @brief Timestamp at which `counter_hi_` was last re-randomized.
    uint64_t ts_counter_hi_ = 0;

    Status last_status_ = Status::NOT_EXECUTED;

    std::unique_ptr<infra::RandomSource> rng_;

    /// @brief Guards every field above for the locked entry points.
    std::mutex mutex_;
};

} // namespace scru128::core
