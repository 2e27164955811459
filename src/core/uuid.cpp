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
 * @file uuid.cpp
 * @brief Implementation of the identifier value type and its codecs.
 */

#include "quid/core/uuid.hpp"

#include "quid/core/errors.hpp"
#include "quid/infra/hex.hpp"

#include <algorithm>
#include <string>

namespace quid::core {

Uuid Uuid::from_bytes(const uint8_t* data, size_t size)
{
    Uuid u;
    decode_binary(data, size, u);
    return u;
}

Uuid Uuid::from_bytes(const std::vector<uint8_t>& data)
{
    return from_bytes(data.data(), data.size());
}

Uuid Uuid::from_string(std::string_view text)
{
    Uuid u;
    decode_text(text, u);
    return u;
}

bool Uuid::is_zero() const
{
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

std::string Uuid::to_string() const
{
    return infra::Hex::encode(data_.data(), data_.size());
}

std::string Uuid::to_canonical_string() const
{
    return infra::Hex::group(to_string());
}

std::vector<uint8_t> Uuid::to_binary() const
{
    return std::vector<uint8_t>(data_.begin(), data_.end());
}

Uuid::Variant Uuid::variant() const
{
    uint8_t b = data_[8];
    if ((b & 0x80) == 0x00)
        return Variant::NCS;
    if ((b & 0xC0) == 0x80)
        return Variant::RFC4122;
    if ((b & 0xE0) == 0xC0)
        return Variant::Microsoft;
    return Variant::Future;
}

/**
 * @brief Decodes the 32- or 36-character text form into `out`.
 *
 * Implementation Strategy:
 * 1. **Length Gate**: Anything under 32 characters is rejected outright.
 * 2. **Separator Stripping**: A 36-character input is the grouped form; every
 * `-` is removed regardless of position.
 * 3. **Staged Decode**: Digits are decoded into a scratch buffer and only
 * committed to `out` once the whole input has been validated.
 */
void decode_text(std::string_view text, Uuid& out)
{
    if (text.size() < Uuid::kTextLength) {
        throw FormatError("invalid UUID string: " + std::string(text));
    }

    std::string digits;
    if (text.size() == Uuid::kCanonicalLength) {
        digits = infra::Hex::strip(text, '-');
    } else {
        digits.assign(text.begin(), text.end());
    }

    Uuid::Bytes staged{};
    if (!infra::Hex::decode(digits, staged.data(), staged.size())) {
        throw FormatError("invalid UUID string: " + std::string(text));
    }
    out.data_ = staged;
}

void decode_binary(const uint8_t* data, size_t size, Uuid& out)
{
    if (size != Uuid::kSize) {
        throw LengthError("UUID must be exactly 16 bytes long, got " + std::to_string(size) +
                          " bytes");
    }
    std::copy(data, data + Uuid::kSize, out.data_.begin());
}

void decode_binary(const std::vector<uint8_t>& data, Uuid& out)
{
    decode_binary(data.data(), data.size(), out);
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << uuid.to_string();
}

} // namespace quid::core

// FNV-1a over the 16 bytes.
size_t std::hash<quid::core::Uuid>::operator()(const quid::core::Uuid& uuid) const noexcept
{
    uint64_t h = 14695981039346656037ULL;
    for (uint8_t b : uuid.bytes()) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}
