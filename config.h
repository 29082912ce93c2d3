/**
 * @file qbm/validation/config.h
 * @brief Compile-time constants shared by the validation engine.
 *
 * Error codes reported by the built-in predicates and the default bounds used
 * by recursive rules. Nothing in here is mutable at run time.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cstddef>

namespace qb::validation {

/// Maximum number of nested applications performed by a recursive rule.
constexpr std::size_t kDefaultMaxDepth = 10;

/// Guard against `$ref` loops that never consume any input while checking a value.
constexpr std::size_t kMaxSchemaDepth = 256;

namespace codes {
constexpr const char *REQUIRED = "required";
constexpr const char *OPTIONAL = "optional";
constexpr const char *TYPE = "type";
constexpr const char *MIN_LENGTH = "minLength";
constexpr const char *MAX_LENGTH = "maxLength";
constexpr const char *LENGTH = "length";
constexpr const char *PATTERN = "pattern";
constexpr const char *STARTS_WITH = "startsWith";
constexpr const char *ENDS_WITH = "endsWith";
constexpr const char *ALPHANUMERIC = "alphanumeric";
constexpr const char *FORMAT = "format";
constexpr const char *CONTENT_ENCODING = "contentEncoding";
constexpr const char *CONTENT_MEDIA_TYPE = "contentMediaType";
constexpr const char *MINIMUM = "minimum";
constexpr const char *MAXIMUM = "maximum";
constexpr const char *MULTIPLE_OF = "multipleOf";
constexpr const char *INTEGER = "integer";
constexpr const char *FINITE = "finite";
constexpr const char *MIN_ITEMS = "minItems";
constexpr const char *MAX_ITEMS = "maxItems";
constexpr const char *UNIQUE_ITEMS = "uniqueItems";
constexpr const char *CONTAINS = "contains";
constexpr const char *INCLUDES = "includes";
constexpr const char *TUPLE = "tuple";
constexpr const char *UNION_GUARD = "unionGuard";
constexpr const char *ENUM = "enum";
constexpr const char *CONST = "const";
constexpr const char *MIN_PROPERTIES = "minProperties";
constexpr const char *MAX_PROPERTIES = "maxProperties";
constexpr const char *ADDITIONAL_PROPERTIES = "additionalProperties";
constexpr const char *COMPARE_FIELD = "compareField";
constexpr const char *REQUIRED_IF = "requiredIf";
constexpr const char *CONTEXT = "context_validation";
constexpr const char *READ_ONLY = "READ_ONLY";
constexpr const char *WRITE_ONLY = "WRITE_ONLY";
constexpr const char *RECURSIVE = "recursive";
constexpr const char *TRANSFORM = "transform";
constexpr const char *CUSTOM = "custom";
constexpr const char *FALLBACK = "VALIDATION_ERROR";
} // namespace codes

} // namespace qb::validation
