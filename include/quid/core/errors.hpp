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
 * @file errors.hpp
 * @brief Exception hierarchy raised by identifier conversions and generators.
 *
 * @details
 * Every failure in the library is reported as an exception derived from
 * `UuidError`, so callers may catch a single base type or discriminate on
 * the concrete failure class. Messages are prefixed with `uuid: `.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace quid::core {

/**
 * @class UuidError
 * @brief Common base of all identifier failures.
 */
class UuidError : public std::runtime_error {
  public:
    explicit UuidError(const std::string& message) : std::runtime_error("uuid: " + message) {}
};

/// @brief Binary input was not exactly 16 bytes.
class LengthError : public UuidError {
  public:
    using UuidError::UuidError;
};

/// @brief Text input was too short, had the wrong digit count, or held non-hex characters.
class FormatError : public UuidError {
  public:
    using UuidError::UuidError;
};

/// @brief A storage value of an unsupported type was scanned into an identifier.
class TypeMismatchError : public UuidError {
  public:
    using UuidError::UuidError;
};

/// @brief The underlying identifier generator could not produce a value.
class GenerationError : public UuidError {
  public:
    using UuidError::UuidError;
};

} // namespace quid::core
