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
 * @brief libuuid-backed implementation of the generator capability.
 *
 * @details
 * A libuuid call that yields the null UUID is treated as a generation
 * failure: neither a random nor a time-based value can legitimately be all
 * zeroes, so it only appears when the library could not obtain entropy or a
 * node identifier.
 */

#include "quid/gen/generator.hpp"

#include "quid/core/errors.hpp"
#include "quid/infra/logger.hpp"

#include <algorithm>
#include <uuid/uuid.h>

namespace quid::gen {

namespace {

core::Uuid::Bytes to_bytes(const uuid_t raw)
{
    core::Uuid::Bytes out{};
    std::copy(raw, raw + out.size(), out.begin());
    return out;
}

[[noreturn]] void fail(const std::string& what)
{
    infra::Logger::log(infra::LogLevel::ERROR, "Generator: " + what);
    throw core::GenerationError(what);
}

} // namespace

core::Uuid::Bytes SystemGenerator::random16()
{
    uuid_t raw;
    uuid_generate_random(raw);
    if (uuid_is_null(raw)) {
        fail("random source returned no data");
    }
    return to_bytes(raw);
}

core::Uuid::Bytes SystemGenerator::time_based16()
{
    uuid_t raw;
    if (uuid_generate_time_safe(raw) != 0) {
        // Still a valid value, but uniqueness across processes is not guaranteed
        // without the uuidd daemon.
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Generator: time-based UUID generated without uuidd synchronisation.");
    }
    if (uuid_is_null(raw)) {
        fail("time-based generator returned no data");
    }
    return to_bytes(raw);
}

int64_t SystemGenerator::now_ms() const
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

/**
 * @brief Assembles a version 7 identifier.
 *
 * Layout:
 * - bytes 0-5: `unix_ts_ms`, big-endian.
 * - byte 6 high nibble: version `0111`; low nibble + byte 7: 12-bit counter.
 * - byte 8 high bits: variant `10`; remaining 62 bits random.
 *
 * Within one millisecond the counter is incremented. When it overflows, the
 * timestamp is advanced by one millisecond so ordering is preserved.
 */
core::Uuid::Bytes SystemGenerator::time_based_random16()
{
    int64_t now = now_ms();
    if (now < 0) {
        fail("system clock reports a time before the Unix epoch");
    }

    uint64_t ms = 0;
    uint16_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(v7_mutex_);
        if (static_cast<uint64_t>(now) > last_ms_) {
            last_ms_ = static_cast<uint64_t>(now);
            sequence_ = 0;
        } else if (++sequence_ > 0x0FFF) {
            ++last_ms_;
            sequence_ = 0;
        }
        ms = last_ms_;
        seq = sequence_;
    }

    core::Uuid::Bytes out = random16();

    for (int i = 0; i < 6; ++i) {
        out[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));
    }
    out[6] = static_cast<uint8_t>(0x70 | ((seq >> 8) & 0x0F));
    out[7] = static_cast<uint8_t>(seq & 0xFF);
    out[8] = static_cast<uint8_t>((out[8] & 0x3F) | 0x80);
    return out;
}

Generator& system_generator()
{
    static SystemGenerator instance;
    return instance;
}

} // namespace quid::gen
