/**
 * @file qbm/validation/jsonschema/schema_validator.h
 * @brief Direct check of a value against a JSON Schema node.
 *
 * Used by the adapter wherever a constraint carries a whole sub-schema:
 * composition branches, `if`/`then`/`else`, tuple positions, `contains`,
 * `propertyNames`, `patternProperties`, schema valued `additionalProperties`,
 * `dependentSchemas` and `$ref` cycles that do not loop back to the root.
 * `$ref` inside a node is resolved against the document given at construction.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <memory>
#include <regex>
#include <string>
#include <qb/json.h>
#include <qb/system/container/unordered_map.h>
#include "../error.h"
#include "../rule/format.h"
#include "./ref_resolver.h"

namespace qb::validation::jsonschema {

class SchemaValidator {
public:
    /**
     * @brief Validator over `document`. Every `$ref` and every `pattern` /
     *        `patternProperties` regex of the document is checked here.
     * @throws ExternalRefError, UnresolvedRefError, SchemaError
     */
    explicit SchemaValidator(std::shared_ptr<const qb::json> document,
                             std::shared_ptr<const FormatMap> custom_formats = nullptr);
    explicit SchemaValidator(const qb::json &document,
                             std::shared_ptr<const FormatMap> custom_formats = nullptr);

    /// Validates `data` against the whole document.
    bool validate(const qb::json &data, Result &result) const;

    /// Validates `data` against `schema_node`, reporting errors below `path`.
    bool validate(const qb::json &data, const qb::json &schema_node, const std::string &path, Result &result) const;

    [[nodiscard]] bool is_valid(const qb::json &data, const qb::json &schema_node) const;

    [[nodiscard]] const qb::json &document() const { return *_document; }

private:
    std::shared_ptr<const qb::json> _document;
    std::shared_ptr<const FormatMap> _custom_formats;
    RefResolver _resolver;
    qb::unordered_map<std::string, std::regex> _patterns;

    void prepare(const qb::json &node);
    bool search(const std::string &pattern, const std::string &text) const;

    bool validate_recursive(const qb::json &value, const qb::json &schema, const std::string &path,
                            Result &result, std::size_t depth) const;

    bool validate_type_keyword(const qb::json &value, const qb::json &type_def, const std::string &path,
                               Result &result) const;
    bool validate_string_keywords(const qb::json &value, const qb::json &schema, const std::string &path,
                                  Result &result) const;
    bool validate_number_keywords(const qb::json &value, const qb::json &schema, const std::string &path,
                                  Result &result) const;
    bool validate_object_keywords(const qb::json &value, const qb::json &schema, const std::string &path,
                                  Result &result, std::size_t depth) const;
    bool validate_array_keywords(const qb::json &value, const qb::json &schema, const std::string &path,
                                 Result &result, std::size_t depth) const;
    bool validate_logical_keywords(const qb::json &value, const qb::json &schema, const std::string &path,
                                   Result &result, std::size_t depth) const;
};

} // namespace qb::validation::jsonschema
