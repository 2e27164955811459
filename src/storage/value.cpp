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
 * @file value.cpp
 * @brief Implementation of the storage value conversions.
 */

#include "quid/storage/value.hpp"

#include "quid/core/errors.hpp"

#include <string_view>
#include <type_traits>

namespace quid::storage {

namespace {

template <typename T> std::string alternative_name()
{
    if constexpr (std::is_same_v<T, std::monostate>)
        return "null";
    else if constexpr (std::is_same_v<T, int64_t>)
        return "int64";
    else if constexpr (std::is_same_v<T, double>)
        return "float64";
    else if constexpr (std::is_same_v<T, bool>)
        return "bool";
    else if constexpr (std::is_same_v<T, Blob>)
        return "bytes";
    else if constexpr (std::is_same_v<T, std::string>)
        return "string";
    else
        return "timestamp";
}

/// Visitor writing each supported alternative into the receiver.
struct ScanVisitor {
    core::Uuid& out;

    void operator()(const std::monostate&) const
    {
        // Write through the receiver so the caller's identifier is cleared.
        out = core::Uuid::zero();
    }

    void operator()(const Blob& blob) const
    {
        if (blob.size() == core::Uuid::kSize) {
            core::decode_binary(blob, out);
            return;
        }
        std::string_view text(reinterpret_cast<const char*>(blob.data()), blob.size());
        core::decode_text(text, out);
    }

    void operator()(const std::string& text) const { core::decode_text(text, out); }

    template <typename T> void operator()(const T&) const
    {
        throw core::TypeMismatchError("cannot convert " + alternative_name<T>() + " to UUID");
    }
};

} // namespace

Value to_value(const core::Uuid& uuid)
{
    if (uuid.is_zero()) {
        return std::monostate{};
    }
    return uuid.to_string();
}

void scan(const Value& src, core::Uuid& out)
{
    std::visit(ScanVisitor{out}, src);
}

std::string type_name(const Value& value)
{
    return std::visit([](const auto& v) { return alternative_name<std::decay_t<decltype(v)>>(); },
                      value);
}

} // namespace quid::storage
