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
 * @file json.cpp
 * @brief Implementation of the cJSON identifier binding.
 */

#include "quid/storage/json.hpp"

#include "quid/core/errors.hpp"

#include <string>

namespace quid::storage {

namespace {

const char* json_type_name(const cJSON* node)
{
    if (cJSON_IsBool(node))
        return "bool";
    if (cJSON_IsNumber(node))
        return "number";
    if (cJSON_IsArray(node))
        return "array";
    if (cJSON_IsObject(node))
        return "object";
    if (cJSON_IsRaw(node))
        return "raw";
    return "invalid";
}

} // namespace

cJSON* to_json(const core::Uuid& uuid)
{
    if (uuid.is_zero()) {
        return cJSON_CreateNull();
    }
    return cJSON_CreateString(uuid.to_string().c_str());
}

bool add_to_object(cJSON* object, const char* key, const core::Uuid& uuid)
{
    if (!cJSON_IsObject(object) || key == nullptr) {
        return false;
    }

    cJSON* node = to_json(uuid);
    if (!node) {
        return false;
    }
    if (!cJSON_AddItemToObject(object, key, node)) {
        cJSON_Delete(node);
        return false;
    }
    return true;
}

void scan_json(const cJSON* node, core::Uuid& out)
{
    if (node == nullptr || cJSON_IsNull(node)) {
        out = core::Uuid::zero();
        return;
    }

    if (cJSON_IsString(node) && node->valuestring != nullptr) {
        core::decode_text(node->valuestring, out);
        return;
    }

    throw core::TypeMismatchError(std::string("cannot convert JSON ") + json_type_name(node) +
                                  " to UUID");
}

} // namespace quid::storage
