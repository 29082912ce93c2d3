/**
 * @file qbm/validation/validation.h
 * @brief Main convenience header for the qbm validation module.
 *
 * Single include point for the public components of the module: error
 * reporting (`validation::Error`, `validation::Result`), field paths
 * (`validation::FieldPath`), rules and their catalog (`validation::Rule`,
 * `validation::rules`, `validation::formats`, `validation::transforms`), the
 * validator and its builders (`validation::Validator`,
 * `validation::ValidatorBuilder`, `validation::FieldBuilder`) and the JSON
 * Schema front end (`validation::jsonschema`).
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include "./config.h"
#include "./error.h"
#include "./options.h"
#include "./types.h"

#include "./path/field_path.h"

#include "./rule/format.h"
#include "./rule/predicates.h"
#include "./rule/rule.h"
#include "./rule/transforms.h"

#include "./engine/compiled_field.h"
#include "./engine/field.h"
#include "./engine/validator.h"

#include "./jsonschema/adapter.h"
#include "./jsonschema/dsl.h"
#include "./jsonschema/error.h"
#include "./jsonschema/options.h"
#include "./jsonschema/ref_resolver.h"
#include "./jsonschema/schema_validator.h"

/**
 * @namespace qb::validation
 * @brief Field path validation engine: rule chains, validation plans and the
 *        JSON Schema adapter.
 */
namespace qb::validation {
    // For convenience, users might want a namespace alias in their own code:
    // namespace jv = qb::validation;
} // namespace qb::validation
