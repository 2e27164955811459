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
 * @file hex.cpp
 * @brief Implementation of the hexadecimal text primitives.
 *
 * @details
 * Encoding uses a fixed lowercase alphabet lookup; decoding scans the input
 * once, two characters per output byte, and stops at the first invalid digit.
 */

#include "quid/infra/hex.hpp"

namespace quid::infra {

namespace {

constexpr char kAlphabet[] = "0123456789abcdef";

/// Group boundaries (in hex digits) of the canonical 8-4-4-4-12 layout.
constexpr size_t kGroupEnds[] = {8, 12, 16, 20};

} // namespace

std::string Hex::encode(const uint8_t* data, size_t size)
{
    std::string out;
    out.resize(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out[i * 2] = kAlphabet[data[i] >> 4];
        out[i * 2 + 1] = kAlphabet[data[i] & 0x0F];
    }
    return out;
}

int Hex::digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}

/**
 * @brief Decodes `2 * size` hex digits into `out`.
 *
 * Implementation Strategy:
 * 1. **Length Gate**: Rejects any input whose digit count differs from the
 * destination capacity, so a long input can never overrun `out`.
 * 2. **Pairwise Scan**: Combines high and low nibbles for each byte, aborting
 * on the first character outside `[0-9a-fA-F]`.
 */
bool Hex::decode(std::string_view text, uint8_t* out, size_t size)
{
    if (text.size() != size * 2) {
        return false;
    }

    for (size_t i = 0; i < size; ++i) {
        int hi = digit_value(text[i * 2]);
        int lo = digit_value(text[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

std::string Hex::strip(std::string_view text, char separator)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != separator) {
            out.push_back(c);
        }
    }
    return out;
}

std::string Hex::group(std::string_view digits, char separator)
{
    if (digits.size() != 32) {
        return std::string(digits);
    }

    std::string out;
    out.reserve(36);
    size_t start = 0;
    for (size_t end : kGroupEnds) {
        out.append(digits.substr(start, end - start));
        out.push_back(separator);
        start = end;
    }
    out.append(digits.substr(start));
    return out;
}

} // namespace quid::infra
