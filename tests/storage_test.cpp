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
 * @file storage_test.cpp
 * @brief Unit tests for the storage value conversions (`to_value` / `scan`).
 *
 * @details
 * Covers both directions of the storage contract:
 * 1. Outbound: the zero identifier is stored as null, anything else as hex text.
 * 2. Inbound: dispatch over bytes, text and null, and rejection of other types.
 */

#include "quid/core/errors.hpp"
#include "quid/core/uuid.hpp"
#include "quid/storage/value.hpp"
#include "framework.hpp"

#include <chrono>
#include <string>
#include <variant>

using quid::core::Uuid;
using quid::storage::Blob;
using quid::storage::Value;

namespace {

const std::string kHex = "a335f2af7103476199db84a015812e9b";

} // namespace

/**
 * @brief The zero identifier maps to null.
 */
void test_value_zero_is_null()
{
    Value v = quid::storage::to_value(Uuid::zero());
    ASSERT_TRUE(std::holds_alternative<std::monostate>(v));
}

/**
 * @brief A non-zero identifier maps to its 32-character string.
 */
void test_value_nonzero_is_hex()
{
    Value v = quid::storage::to_value(Uuid::from_string(kHex));
    ASSERT_TRUE(std::holds_alternative<std::string>(v));
    ASSERT_EQ(std::get<std::string>(v), kHex);
}

/**
 * @brief A 16-byte blob is read through the binary path.
 */
void test_scan_blob_binary()
{
    Uuid expected = Uuid::from_string(kHex);

    Uuid out;
    quid::storage::scan(Value(expected.to_binary()), out);
    ASSERT_EQ(out, expected);
}

/**
 * @brief Blobs of other lengths are read as text.
 */
void test_scan_blob_text()
{
    Uuid expected = Uuid::from_string(kHex);

    std::string grouped = expected.to_canonical_string();
    Uuid out;
    quid::storage::scan(Value(Blob(grouped.begin(), grouped.end())), out);
    ASSERT_EQ(out, expected);

    quid::storage::scan(Value(Blob(kHex.begin(), kHex.end())), out);
    ASSERT_EQ(out, expected);

    // Neither 16 bytes nor valid text.
    ASSERT_THROWS(quid::storage::scan(Value(Blob(15, 0x01)), out), quid::core::FormatError);
}

/**
 * @brief Strings are read as text; the result matches a direct decode.
 */
void test_scan_string()
{
    Uuid out;
    quid::storage::scan(Value(kHex), out);
    ASSERT_EQ(out, Uuid::from_string(kHex));

    ASSERT_THROWS(quid::storage::scan(Value(std::string("not-a-uuid")), out),
                  quid::core::FormatError);
}

/**
 * @brief Scanning null clears a previously non-zero receiver.
 */
void test_scan_null_clears()
{
    Uuid out = Uuid::from_string(kHex);
    ASSERT_FALSE(out.is_zero());

    quid::storage::scan(Value(), out);
    ASSERT_TRUE(out.is_zero());
}

/**
 * @brief Integers, floats, booleans and timestamps raise TypeMismatchError.
 */
void test_scan_type_mismatch()
{
    Uuid out = Uuid::from_string(kHex);

    ASSERT_THROWS(quid::storage::scan(Value(int64_t{42}), out), quid::core::TypeMismatchError);
    ASSERT_THROWS(quid::storage::scan(Value(3.5), out), quid::core::TypeMismatchError);
    ASSERT_THROWS(quid::storage::scan(Value(true), out), quid::core::TypeMismatchError);
    ASSERT_THROWS(quid::storage::scan(Value(std::chrono::system_clock::now()), out),
                  quid::core::TypeMismatchError);

    // The receiver is untouched by a rejected scan.
    ASSERT_EQ(out.to_string(), kHex);

    try {
        quid::storage::scan(Value(int64_t{7}), out);
        ASSERT_TRUE(false);
    } catch (const quid::core::TypeMismatchError& e) {
        ASSERT_EQ(std::string(e.what()), std::string("uuid: cannot convert int64 to UUID"));
    }
}

/**
 * @brief Alternative names used in diagnostics.
 */
void test_value_type_name()
{
    ASSERT_EQ(quid::storage::type_name(Value()), std::string("null"));
    ASSERT_EQ(quid::storage::type_name(Value(int64_t{1})), std::string("int64"));
    ASSERT_EQ(quid::storage::type_name(Value(1.0)), std::string("float64"));
    ASSERT_EQ(quid::storage::type_name(Value(false)), std::string("bool"));
    ASSERT_EQ(quid::storage::type_name(Value(Blob{})), std::string("bytes"));
    ASSERT_EQ(quid::storage::type_name(Value(std::string())), std::string("string"));
}
