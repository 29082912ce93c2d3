/**
 * @file qbm/validation/jsonschema/options.h
 * @brief Options of the JSON Schema adapter.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "../config.h"
#include "../rule/format.h"

namespace qb::validation::jsonschema {

class Options {
private:
    std::shared_ptr<FormatMap> _custom_formats = std::make_shared<FormatMap>();
    bool _strict_required = false;
    std::optional<bool> _allow_additional_properties;
    std::size_t _max_recursion_depth = kDefaultMaxDepth;

public:
    Options() = default;

    /**
     * @brief Registers a format checker, consulted before the built-in ones.
     */
    Options &custom_format(const std::string &name, FormatCheck check) {
        // Copy on write: options copied earlier keep their own table.
        auto table = std::make_shared<FormatMap>(*_custom_formats);
        (*table)[name] = std::move(check);
        _custom_formats = std::move(table);
        return *this;
    }

    /**
     * @brief When set, `required` only rejects absent properties; `null` and
     *        `""` count as present. The default also rejects them.
     */
    Options &strict_required(bool value) {
        _strict_required = value;
        return *this;
    }

    /**
     * @brief Overrides every boolean (or absent) `additionalProperties` of
     *        object schemas that declare `properties`.
     */
    Options &allow_additional_properties(std::optional<bool> value) {
        _allow_additional_properties = value;
        return *this;
    }

    Options &max_recursion_depth(std::size_t depth) {
        _max_recursion_depth = depth;
        return *this;
    }

    [[nodiscard]] std::shared_ptr<const FormatMap> custom_formats() const { return _custom_formats; }
    [[nodiscard]] bool strict_required() const { return _strict_required; }
    [[nodiscard]] const std::optional<bool> &allow_additional_properties() const { return _allow_additional_properties; }
    [[nodiscard]] std::size_t max_recursion_depth() const { return _max_recursion_depth; }
};

} // namespace qb::validation::jsonschema
