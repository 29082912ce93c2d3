/**
 * @file qbm/validation/rule/format.h
 * @brief Read-only table of string format checkers (`email`, `uuid`, `ipv4`...).
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <string>
#include <qb/system/container/unordered_map.h>

namespace qb::validation {

using FormatCheck = std::function<bool(const std::string &)>;
using FormatMap = qb::unordered_map<std::string, FormatCheck>;

namespace formats {

/**
 * @brief Built-in checkers keyed by format name. Built once, never mutated.
 */
const FormatMap &builtin();

[[nodiscard]] bool is_known(const std::string &name);

/**
 * @brief Checks `value` against the named format.
 *
 * `custom` is consulted before the built-ins. Unknown names pass.
 */
[[nodiscard]] bool check(const std::string &name, const std::string &value, const FormatMap *custom = nullptr);

/// Standard alphabet base64 with `=` padding, length multiple of 4.
[[nodiscard]] bool is_base64(const std::string &value);

} // namespace formats
} // namespace qb::validation
