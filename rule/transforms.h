/**
 * @file qbm/validation/rule/transforms.h
 * @brief Predefined value transforms for `Validator::parse`.
 *
 * String transforms leave non-string values untouched.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <string>
#include "./rule.h"

namespace qb::validation {

using StringTransform = std::function<std::string(const std::string &input)>;

namespace transforms {

/** @brief Lifts a string function to a `TransformFn` that ignores non-strings. */
TransformFn on_string(StringTransform fn);

/** @brief Trims leading and trailing whitespace. */
TransformFn trim();
TransformFn to_lower_case();
TransformFn to_upper_case();
/** @brief Escapes HTML special characters (&, <, >, ", '). */
TransformFn escape_html();
/** @brief Strips anything that looks like an HTML tag. Not an XSS defence. */
TransformFn strip_html_tags();
TransformFn alphanumeric_only();
/** @brief Trims ends and collapses internal whitespace runs to one space. */
TransformFn normalize_whitespace();
/** @brief Numeric strings become numbers, other values are returned as is. */
TransformFn to_number();
/** @brief "true", "1", "yes", "on" (any case) become true, "false", "0", "no", "off" false. */
TransformFn to_boolean();

} // namespace transforms
} // namespace qb::validation
