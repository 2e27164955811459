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
 * @file json.hpp
 * @brief Binding of identifiers to cJSON document fields.
 *
 * @details
 * Document stores built on cJSON keep identifiers (typically `_id`) as JSON
 * fields. The mapping mirrors the storage value contract: the zero identifier
 * becomes JSON `null`, any other identifier its 32-character hex string.
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <cJSON.h>

namespace quid::storage {

/**
 * @brief Creates a JSON node for an identifier.
 *
 * @return cJSON* A `cJSON_NULL` node for the zero identifier, a string node otherwise.
 *
 * @warning The caller assumes ownership of the returned node and must either
 * attach it to a parent or free it with `cJSON_Delete`.
 */
cJSON* to_json(const core::Uuid& uuid);

/**
 * @brief Attaches an identifier to a JSON object under `key`.
 *
 * @return true If the node was created and attached.
 */
bool add_to_object(cJSON* object, const char* key, const core::Uuid& uuid);

/**
 * @brief Reads a JSON node into an existing identifier.
 *
 * A missing node (`nullptr`) or JSON `null` resets `out` to zero; a string
 * node is text-decoded.
 *
 * @throws core::TypeMismatchError For numbers, booleans, arrays and objects.
 * @throws core::FormatError If a string node is not a valid identifier.
 */
void scan_json(const cJSON* node, core::Uuid& out);

} // namespace quid::storage
