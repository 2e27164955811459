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
 * @file value.hpp
 * @brief Conversion between identifiers and generic storage-layer values.
 *
 * @details
 * Storage drivers exchange column data as a small closed set of shapes: null,
 * integers, floating point, booleans, raw bytes, text and timestamps. `Value`
 * models that set as a `std::variant`. An identifier is stored as null when it
 * is zero and as its 32-character hex text otherwise, and can be read back from
 * bytes, text or null.
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace quid::storage {

/// @brief Raw byte column contents.
using Blob = std::vector<uint8_t>;

/// @brief Timestamp column contents.
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A single storage-layer value.
 *
 * `std::monostate` is SQL `NULL`.
 */
using Value = std::variant<std::monostate, int64_t, double, bool, Blob, std::string, Timestamp>;

/**
 * @brief Converts an identifier into its storage representation.
 *
 * @return Value `std::monostate` for the zero identifier, otherwise the
 * 32-character lowercase hex string.
 */
Value to_value(const core::Uuid& uuid);

/**
 * @brief Reads a storage value into an existing identifier.
 *
 * **Dispatch on the active alternative:**
 * - `Blob` of exactly 16 bytes: binary decode.
 * - `Blob` of any other length: text decode of the bytes.
 * - `std::string`: text decode.
 * - `std::monostate`: `out` is reset to the zero identifier.
 * - Anything else: `TypeMismatchError`.
 *
 * @param src The value read from storage.
 * @param out The identifier to overwrite.
 *
 * @throws core::TypeMismatchError For unsupported alternatives.
 * @throws core::FormatError, core::LengthError From the underlying decoders.
 */
void scan(const Value& src, core::Uuid& out);

/// @brief Name of the active alternative, e.g. `"int64"` or `"null"`.
std::string type_name(const Value& value);

} // namespace quid::storage
