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
 * @file factory.cpp
 * @brief Implementation of the identifier constructors.
 */

#include "quid/gen/factory.hpp"

#include "quid/infra/logger.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace quid::gen {

namespace {

/**
 * @brief Splits the canonical text into its five groups.
 */
std::vector<std::string> split_groups(const std::string& canonical)
{
    std::vector<std::string> groups;
    size_t start = 0;
    while (true) {
        size_t pos = canonical.find('-', start);
        if (pos == std::string::npos) {
            groups.push_back(canonical.substr(start));
            break;
        }
        groups.push_back(canonical.substr(start, pos - start));
        start = pos + 1;
    }
    return groups;
}

/**
 * @brief Reorders through the grouped text, keeping separators between groups.
 *
 * `g1-g2-g3-g4-g5` becomes `g3-g2-g1-g4-g5`, which the text decoder strips back
 * to 32 digits.
 */
core::Uuid reorder_preserving_separators(const core::Uuid& raw)
{
    std::vector<std::string> g = split_groups(raw.to_canonical_string());
    std::string reordered = g[2] + "-" + g[1] + "-" + g[0] + "-" + g[3] + "-" + g[4];
    return core::Uuid::from_string(reordered);
}

} // namespace

core::Uuid::Bytes reorder_time_fields(const core::Uuid::Bytes& in)
{
    core::Uuid::Bytes out{};
    auto it = out.begin();
    it = std::copy(in.begin() + 6, in.begin() + 8, it); // time_hi_and_version
    it = std::copy(in.begin() + 4, in.begin() + 6, it); // time_mid
    it = std::copy(in.begin() + 0, in.begin() + 4, it); // time_low
    std::copy(in.begin() + 8, in.end(), it);            // clock_seq + node
    return out;
}

core::Uuid new_v4(Generator& gen)
{
    return core::Uuid(gen.random16());
}

core::Uuid new_v1(Generator& gen)
{
    return core::Uuid(gen.time_based16());
}

core::Uuid new_v1_ordered(Generator& gen, SeparatorMode mode)
{
    core::Uuid raw(gen.time_based16());

    if (mode == SeparatorMode::Preserve) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "Factory: ordered v1 via separator-preserving text path.");
        return reorder_preserving_separators(raw);
    }
    return core::Uuid(reorder_time_fields(raw.bytes()));
}

core::Uuid new_v7(Generator& gen)
{
    return core::Uuid(gen.time_based_random16());
}

core::Uuid new_v4()
{
    return new_v4(system_generator());
}

core::Uuid new_v1()
{
    return new_v1(system_generator());
}

core::Uuid new_v1_ordered(SeparatorMode mode)
{
    return new_v1_ordered(system_generator(), mode);
}

core::Uuid new_v7()
{
    return new_v7(system_generator());
}

} // namespace quid::gen
