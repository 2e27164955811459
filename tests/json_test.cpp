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
 * @file json_test.cpp
 * @brief Unit tests for the cJSON document field binding.
 */

#include "quid/core/errors.hpp"
#include "quid/core/uuid.hpp"
#include "quid/storage/json.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <string>

using quid::core::Uuid;

namespace {

const std::string kHex = "18bc4316fb86466e80d307ac0ea5cc68";

} // namespace

/**
 * @brief The zero identifier serialises as JSON null.
 */
void test_json_zero_is_null()
{
    cJSON* node = quid::storage::to_json(Uuid::zero());
    ASSERT_TRUE(node != nullptr);
    ASSERT_TRUE(cJSON_IsNull(node));
    cJSON_Delete(node);
}

/**
 * @brief An `_id` field survives print and re-parse of the enclosing document.
 *
 * **Scenario Execution:**
 * 1. Attach an identifier to a document under `_id`.
 * 2. Print the document unformatted and parse it back.
 * 3. Scan the `_id` field and compare.
 */
void test_json_document_round_trip()
{
    Uuid id = Uuid::from_string(kHex);

    cJSON* doc = cJSON_CreateObject();
    ASSERT_TRUE(quid::storage::add_to_object(doc, "_id", id));
    cJSON_AddStringToObject(doc, "name", "unit_test_entry");

    char* raw = cJSON_PrintUnformatted(doc);
    std::string printed = raw;
    free(raw);
    cJSON_Delete(doc);

    ASSERT_TRUE(printed.find("\"_id\":\"" + kHex + "\"") != std::string::npos);

    cJSON* parsed = cJSON_Parse(printed.c_str());
    ASSERT_TRUE(parsed != nullptr);

    Uuid out;
    quid::storage::scan_json(cJSON_GetObjectItem(parsed, "_id"), out);
    cJSON_Delete(parsed);

    ASSERT_EQ(out, id);
}

/**
 * @brief Missing fields and JSON null reset the receiver to zero.
 */
void test_json_missing_or_null_resets()
{
    Uuid out = Uuid::from_string(kHex);
    quid::storage::scan_json(nullptr, out);
    ASSERT_TRUE(out.is_zero());

    out = Uuid::from_string(kHex);
    cJSON* null_node = cJSON_CreateNull();
    quid::storage::scan_json(null_node, out);
    cJSON_Delete(null_node);
    ASSERT_TRUE(out.is_zero());
}

/**
 * @brief Non-string, non-null nodes raise TypeMismatchError; bad strings FormatError.
 */
void test_json_rejects_other_types()
{
    Uuid out;

    cJSON* number = cJSON_CreateNumber(1337);
    ASSERT_THROWS(quid::storage::scan_json(number, out), quid::core::TypeMismatchError);
    cJSON_Delete(number);

    cJSON* obj = cJSON_CreateObject();
    ASSERT_THROWS(quid::storage::scan_json(obj, out), quid::core::TypeMismatchError);
    ASSERT_FALSE(quid::storage::add_to_object(nullptr, "_id", out));
    cJSON_Delete(obj);

    cJSON* bad = cJSON_CreateString("xyz");
    ASSERT_THROWS(quid::storage::scan_json(bad, out), quid::core::FormatError);
    cJSON_Delete(bad);
}

/**
 * @brief A rejected attach reports failure and leaves the target untouched.
 *
 * **Scenario Execution:**
 * 1. Attach to an array, a null target and with a null key: each returns false.
 * 2. The array stays empty; no node is leaked or half-attached.
 * 3. A valid attach on an object still succeeds alongside the failed ones.
 */
void test_json_add_rejects_invalid_target()
{
    Uuid id = Uuid::from_string(kHex);

    cJSON* arr = cJSON_CreateArray();
    ASSERT_FALSE(quid::storage::add_to_object(arr, "_id", id));
    ASSERT_EQ(cJSON_GetArraySize(arr), 0);
    cJSON_Delete(arr);

    ASSERT_FALSE(quid::storage::add_to_object(nullptr, "_id", id));

    cJSON* doc = cJSON_CreateObject();
    ASSERT_FALSE(quid::storage::add_to_object(doc, nullptr, id));
    ASSERT_TRUE(quid::storage::add_to_object(doc, "_id", id));
    ASSERT_EQ(cJSON_GetArraySize(doc), 1);

    Uuid out;
    quid::storage::scan_json(cJSON_GetObjectItem(doc, "_id"), out);
    cJSON_Delete(doc);
    ASSERT_EQ(out, id);
}
