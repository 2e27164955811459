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
 * @brief Source of raw identifier bytes.
 *
 * @details
 * The identifier constructors never produce entropy or read clocks
 * themselves; they ask a `Generator` for 16 raw bytes in the layout of the
 * requested version. `SystemGenerator` is backed by libuuid. Tests substitute
 * their own implementation returning fixed byte sequences.
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>

namespace quid::gen {

/**
 * @class Generator
 * @brief Capability interface for the three supported generation schemes.
 *
 * Implementations report failure by throwing `core::GenerationError`.
 */
class Generator {
  public:
    virtual ~Generator() = default;

    /**
     * @brief Version 4: 122 random bits plus version and variant.
     */
    virtual core::Uuid::Bytes random16() = 0;

    /**
     * @brief Version 1: RFC 4122 timestamp, clock sequence and node identifier.
     *
     * Byte layout: `time_low(4) time_mid(2) time_hi_and_version(2)
     * clock_seq(2) node(6)`.
     */
    virtual core::Uuid::Bytes time_based16() = 0;

    /**
     * @brief Version 7: 48-bit Unix millisecond timestamp followed by random bits.
     */
    virtual core::Uuid::Bytes time_based_random16() = 0;
};

/**
 * @class SystemGenerator
 * @brief `Generator` backed by the system libuuid.
 *
 * @details
 * Versions 1 and 4 are delegated to `uuid_generate_time_safe` and
 * `uuid_generate_random`. The libuuid shipped with current distributions has
 * no version 7 entry point, so version 7 values are assembled here: the
 * millisecond timestamp occupies bytes 0-5, a 12-bit counter in `rand_a`
 * keeps values generated within the same millisecond strictly increasing, and
 * the tail is taken from `uuid_generate_random`.
 *
 * @note Thread-safe. libuuid serialises its own state; the version 7 counter is
 * guarded by an internal mutex.
 */
class SystemGenerator : public Generator {
  public:
    core::Uuid::Bytes random16() override;
    core::Uuid::Bytes time_based16() override;
    core::Uuid::Bytes time_based_random16() override;

  protected:
    /// @brief Milliseconds since the Unix epoch. Overridable for clock injection.
    virtual int64_t now_ms() const;

  private:
    std::mutex v7_mutex_;
    uint64_t last_ms_ = 0;
    uint16_t sequence_ = 0;
};

/**
 * @brief Returns the process-wide libuuid-backed generator.
 */
Generator& system_generator();

} // namespace quid::gen
