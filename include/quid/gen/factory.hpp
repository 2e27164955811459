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
 * @file factory.hpp
 * @brief Constructors for random and time-based identifiers.
 *
 * @details
 * Each constructor comes in two forms: one taking an explicit `Generator`
 * and one using `system_generator()`. Generator failures surface as
 * `core::GenerationError`.
 *
 * **Time-ordered identifiers:** a plain version 1 value stores the least
 * significant timestamp bits first (`time_low`), so byte order does not follow
 * creation order. `new_v1_ordered` moves `time_hi_and_version` and `time_mid`
 * in front of `time_low`, which makes the raw bytes sort close to
 * chronologically.
 */

#pragma once

#include "quid/core/uuid.hpp"
#include "quid/gen/generator.hpp"

namespace quid::gen {

/**
 * @enum SeparatorMode
 * @brief Text layout requested for the ordered version 1 constructor.
 *
 * Both modes currently yield the same 16 bytes; the separators only exist in
 * the intermediate canonical text.
 */
enum class SeparatorMode {
    Strip,   ///< Canonical separators are removed before decoding.
    Preserve ///< Canonical separator layout is kept in the intermediate form.
};

/// @brief Version 4 (random) identifier.
core::Uuid new_v4(Generator& gen);
core::Uuid new_v4();

/// @brief Version 1 identifier with the generator's byte layout used as-is.
core::Uuid new_v1(Generator& gen);
core::Uuid new_v1();

/**
 * @brief Version 1 identifier with time fields reordered for sortability.
 *
 * Given the canonical form `g1-g2-g3-g4-g5`, the result is `g3g2g1g4g5`.
 */
core::Uuid new_v1_ordered(Generator& gen, SeparatorMode mode = SeparatorMode::Strip);
core::Uuid new_v1_ordered(SeparatorMode mode = SeparatorMode::Strip);

/// @brief Version 7 (timestamp prefix + random) identifier, no reordering.
core::Uuid new_v7(Generator& gen);
core::Uuid new_v7();

/**
 * @brief Reorders a version 1 byte layout into the sortable layout.
 *
 * Output bytes: `in[6..8) in[4..6) in[0..4) in[8..16)`.
 */
core::Uuid::Bytes reorder_time_fields(const core::Uuid::Bytes& in);

} // namespace quid::gen
