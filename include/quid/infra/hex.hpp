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
 * @file hex.hpp
 * @brief Hexadecimal text primitives shared by the identifier codecs.
 *
 * @details
 * This header defines the `Hex` utility class, a static collection of
 * stateless routines for turning byte buffers into lowercase hexadecimal text
 * and back, plus the separator handling needed by the canonical
 * `8-4-4-4-12` identifier layout.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace quid::infra {

/**
 * @class Hex
 * @brief A static container for hexadecimal encoding algorithms.
 *
 * @details
 * None of the functions allocate beyond their return value, and none of them
 * throw; decoding failures are reported through the boolean result so the
 * caller can map them onto its own error type.
 */
class Hex {
  public:
    /**
     * @brief Encodes a byte buffer as lowercase hexadecimal.
     *
     * @param data Pointer to the first byte.
     * @param size Number of bytes to encode.
     * @return std::string A string of exactly `2 * size` characters.
     *
     * @code
     * const uint8_t raw[] = {0xde, 0xad};
     * std::string s = quid::infra::Hex::encode(raw, 2); // "dead"
     * @endcode
     */
    static std::string encode(const uint8_t* data, size_t size);

    /**
     * @brief Decodes hexadecimal text into a caller-provided buffer.
     *
     * Upper- and lowercase digits are accepted. The text must hold exactly
     * `2 * size` digits.
     *
     * @param text The hexadecimal input.
     * @param out Destination buffer of at least `size` bytes.
     * @param size Number of bytes expected.
     * @return true If every digit was valid and the length matched.
     * @return false Otherwise. `out` may have been partially written.
     */
    static bool decode(std::string_view text, uint8_t* out, size_t size);

    /**
     * @brief Converts a single hexadecimal digit to its value.
     *
     * @return int The nibble value in `[0, 15]`, or `-1` for a non-hex character.
     */
    static int digit_value(char c);

    /**
     * @brief Returns a copy of `text` with every occurrence of `separator` removed.
     */
    static std::string strip(std::string_view text, char separator);

    /**
     * @brief Inserts separators into a 32-digit string using the 8-4-4-4-12 grouping.
     *
     * @param digits Exactly 32 hexadecimal characters.
     * @param separator The character to insert between groups.
     * @return std::string The 36-character grouped form, or `digits` unchanged
     * if it is not 32 characters long.
     */
    static std::string group(std::string_view digits, char separator = '-');
};

} // namespace quid::infra
