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
 * @file generator.cpp
 * @brief Implementation of the identifier generation state machine.
 *
 * @details
 * Both unlocked cores share `advance()`, which holds the complete ordering
 * logic. They differ only in what they do when `advance()` reports a rollback
 * beyond the allowance: the reset core reopens a window at the regressed
 * timestamp, the abort core returns `std::nullopt`.
 */

#include "scru128/core/generator.hpp"

#include "scru128/core/error.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace scru128::core {

namespace {

/// Generator milliseconds after which `counter_hi` is re-randomized.
constexpr uint64_t COUNTER_HI_REFRESH_INTERVAL = 1'000;

/// @brief Reads the wall clock as milliseconds since the Unix epoch.
uint64_t now_millis()
{
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

} // namespace

Generator::Generator() : Generator(std::make_unique<infra::SystemRandom>()) {}

Generator::Generator(std::unique_ptr<infra::RandomSource> rng) : rng_(std::move(rng))
{
    if (!rng_) {
        throw std::invalid_argument("Generator requires a random source");
    }
}

Id Generator::generate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generate_or_reset_core(now_millis(), DEFAULT_ROLLBACK_ALLOWANCE);
}

std::optional<Id> Generator::generate_or_abort()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generate_or_abort_core(now_millis(), DEFAULT_ROLLBACK_ALLOWANCE);
}

Id Generator::generate_or_reset_core(uint64_t timestamp, uint64_t rollback_allowance)
{
    check_arguments(timestamp, rollback_allowance);

    if (!advance(timestamp, rollback_allowance)) {
        // Forget the previous window entirely. Since timestamp >= 1, reopening
        // always takes the new-window path.
        timestamp_ = 0;
        ts_counter_hi_ = 0;
        open_window(timestamp);
        last_status_ = Status::CLOCK_ROLLBACK;
    }
    return emit();
}

std::optional<Id> Generator::generate_or_abort_core(uint64_t timestamp,
                                                    uint64_t rollback_allowance)
{
    check_arguments(timestamp, rollback_allowance);

    if (!advance(timestamp, rollback_allowance)) {
        return std::nullopt;
    }
    return emit();
}

void Generator::check_arguments(uint64_t timestamp, uint64_t rollback_allowance)
{
    if (timestamp == 0 || timestamp > MAX_TIMESTAMP) {
        throw RangeError("timestamp must be within 1..2^48-1: " + std::to_string(timestamp));
    }
    if (rollback_allowance > MAX_TIMESTAMP) {
        throw RangeError("rollback_allowance must be within 0..2^48-1: " +
                         std::to_string(rollback_allowance));
    }
}

bool Generator::advance(uint64_t timestamp, uint64_t rollback_allowance)
{
    if (timestamp > timestamp_) {
        open_window(timestamp);
        last_status_ = Status::NEW_TIMESTAMP;
        return true;
    }

    // Both operands are at most 48 bits wide, so the sum cannot wrap.
    if (timestamp + rollback_allowance > timestamp_) {
        ++counter_lo_;
        last_status_ = Status::COUNTER_LO_INC;
        if (counter_lo_ > MAX_COUNTER_LO) {
            counter_lo_ = 0;
            ++counter_hi_;
            last_status_ = Status::COUNTER_HI_INC;
            if (counter_hi_ > MAX_COUNTER_HI) {
                counter_hi_ = 0;
                // Borrow one millisecond from the future.
                ++timestamp_;
                counter_lo_ = next_u24();
                last_status_ = Status::TIMESTAMP_INC;
            }
        }
        return true;
    }

    return false;
}

void Generator::open_window(uint64_t timestamp)
{
    timestamp_ = timestamp;
    counter_lo_ = next_u24();
}

Id Generator::emit()
{
    if (ts_counter_hi_ == 0 || timestamp_ - ts_counter_hi_ >= COUNTER_HI_REFRESH_INTERVAL) {
        ts_counter_hi_ = timestamp_;
        counter_hi_ = next_u24();
    }
    return Id::from_fields(timestamp_, counter_hi_, counter_lo_, rng_->next_u32());
}

uint32_t Generator::next_u24()
{
    return rng_->next_u32() & MAX_COUNTER_HI;
}

} // namespace scru128::core
