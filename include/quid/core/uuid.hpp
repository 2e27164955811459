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
 * @file uuid.hpp
 * @brief The 128-bit identifier value type and its text/binary codecs.
 *
 * @details
 * `Uuid` is a plain 16-byte value. It carries no behaviour beyond comparison
 * and formatting; parsing is done through the `decode_text` / `decode_binary`
 * functions, which overwrite an existing receiver, or through the
 * `Uuid::from_string` / `Uuid::from_bytes` factories built on top of them.
 *
 * **Text forms accepted by decoding:**
 * - `3f2504e04f8941d39a0c0305e82c3301` (32 hex digits)
 * - `3f2504e0-4f89-41d3-9a0c-0305e82c3301` (36 characters, separators stripped)
 *
 * Encoding always emits the 32-digit lowercase form.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace quid::core {

/**
 * @class Uuid
 * @brief An immutable 16-byte identifier compared byte-for-byte.
 *
 * @details
 * The default-constructed value is the zero identifier, which storage
 * conversions treat as "absent". Ordering is lexicographic over the raw bytes,
 * which is what makes the reordered time-based variant sortable.
 */
class Uuid {
  public:
    /// @brief Size of the binary encoding in bytes.
    static constexpr size_t kSize = 16;

    /// @brief Number of characters in the unseparated text form.
    static constexpr size_t kTextLength = 32;

    /// @brief Number of characters in the canonical 8-4-4-4-12 text form.
    static constexpr size_t kCanonicalLength = 36;

    using Bytes = std::array<uint8_t, kSize>;

    /**
     * @enum Variant
     * @brief Layout family encoded in the high bits of byte 8.
     */
    enum class Variant {
        NCS,       ///< `0xxx`: reserved, NCS backward compatibility.
        RFC4122,   ///< `10xx`: the layout produced by every generator in this library.
        Microsoft, ///< `110x`: reserved, Microsoft GUID compatibility.
        Future     ///< `111x`: reserved for future definition.
    };

    /// @brief Constructs the zero identifier.
    Uuid() = default;

    /// @brief Wraps 16 raw bytes.
    explicit Uuid(const Bytes& bytes) : data_(bytes) {}

    /// @brief Returns the all-zero sentinel.
    static Uuid zero() { return Uuid(); }

    /**
     * @brief Builds an identifier from a raw binary buffer.
     *
     * @throws LengthError If `size` is not exactly 16.
     */
    static Uuid from_bytes(const uint8_t* data, size_t size);

    /// @overload
    static Uuid from_bytes(const std::vector<uint8_t>& data);

    /**
     * @brief Builds an identifier from its 32- or 36-character text form.
     *
     * @throws FormatError If the text is too short or is not valid hexadecimal.
     */
    static Uuid from_string(std::string_view text);

    /// @brief True iff every byte is zero.
    bool is_zero() const;

    /// @brief Lowercase hex, no separators, always 32 characters.
    std::string to_string() const;

    /// @brief Lowercase hex in the grouped 8-4-4-4-12 form, always 36 characters.
    std::string to_canonical_string() const;

    /// @brief The raw 16 bytes.
    const Bytes& bytes() const { return data_; }

    /// @brief The binary encoding as an owned buffer (identity over `bytes()`).
    std::vector<uint8_t> to_binary() const;

    /// @brief Version number held in the high nibble of byte 6.
    int version() const { return data_[6] >> 4; }

    /// @brief Layout family held in the high bits of byte 8.
    Variant variant() const;

    friend bool operator==(const Uuid& a, const Uuid& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Uuid& a, const Uuid& b) { return a.data_ != b.data_; }
    friend bool operator<(const Uuid& a, const Uuid& b) { return a.data_ < b.data_; }
    friend bool operator>(const Uuid& a, const Uuid& b) { return b < a; }
    friend bool operator<=(const Uuid& a, const Uuid& b) { return !(b < a); }
    friend bool operator>=(const Uuid& a, const Uuid& b) { return !(a < b); }

    friend void decode_text(std::string_view text, Uuid& out);
    friend void decode_binary(const uint8_t* data, size_t size, Uuid& out);

  private:
    Bytes data_{};
};

/**
 * @brief Decodes text into an existing identifier, overwriting all 16 bytes.
 *
 * Input shorter than 32 characters is rejected. Input of exactly 36 characters
 * has every `-` removed first. What remains must be exactly 32 hex digits.
 * On failure `out` is left untouched.
 *
 * @throws FormatError On any malformed input.
 */
void decode_text(std::string_view text, Uuid& out);

/**
 * @brief Copies exactly 16 bytes into an existing identifier.
 *
 * @throws LengthError If `size` is not 16. `out` is left untouched.
 */
void decode_binary(const uint8_t* data, size_t size, Uuid& out);

/// @overload
void decode_binary(const std::vector<uint8_t>& data, Uuid& out);

/// @brief Writes the 32-character form.
std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace quid::core

namespace std {

template <> struct hash<quid::core::Uuid> {
    size_t operator()(const quid::core::Uuid& uuid) const noexcept;
};

} // namespace std
