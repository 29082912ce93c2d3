/**
 * @file qbm/validation/jsonschema/adapter.h
 * @brief JSON Schema (draft-07) front end of the validation engine.
 *
 * `from_json_schema` is the one call most users need:
 * @code
 * auto validator = qb::validation::jsonschema::from_json_schema(schema);
 * auto result = validator.validate(payload, ValidationOptions::collect_all());
 * @endcode
 *
 * The conversion runs `schema -> to_dsl -> to_field_definitions -> Validator`.
 * Constraints that cannot be expressed on a single path (compositions,
 * conditionals, tuple positions...) become rules backed by a
 * `SchemaValidator` sharing the document.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <vector>
#include <qb/json.h>
#include "../engine/field.h"
#include "../engine/validator.h"
#include "./dsl.h"
#include "./options.h"

namespace qb::validation::jsonschema {

/**
 * @brief Expands DSL records into field definitions.
 * @param document document the `$ref` left in the records point into.
 * @throws SchemaError (and its subclasses) on invalid constraints or references.
 */
std::vector<FieldDefinition> to_field_definitions(const std::vector<DslRecord> &records,
                                                  const qb::json &document = qb::json::object(),
                                                  const Options &options = {});

/**
 * @brief Builds a validator enforcing `schema`.
 * @throws SchemaError, ExternalRefError, UnresolvedRefError
 */
Validator from_json_schema(const qb::json &schema, const Options &options = {});

} // namespace qb::validation::jsonschema
