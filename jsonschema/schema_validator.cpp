/**
 * @file qbm/validation/jsonschema/schema_validator.cpp
 * @brief Implementation of the SchemaValidator class.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./schema_validator.h"
#include <algorithm>
#include <cmath>
#include <qb/system/container/unordered_set.h>
#include "../config.h"
#include "../logger.h"
#include "../path/field_path.h"
#include "../rule/predicates.h"
#include "../types.h"
#include "./error.h"

namespace qb::validation::jsonschema {
namespace {

constexpr auto kRegexFlags = std::regex_constants::ECMAScript | std::regex_constants::optimize;

const qb::json *member(const qb::json &schema, const char *key) {
    const auto it = schema.find(key);
    return it == schema.end() ? nullptr : &*it;
}

std::string child_path(const std::string &path, const std::string &key) {
    return FieldPath::join(path, key);
}

std::string index_path(const std::string &path, std::size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

bool parse_type_name(const std::string &name, DataType &out) {
    if (name == "string") out = DataType::STRING;
    else if (name == "integer") out = DataType::INTEGER;
    else if (name == "number") out = DataType::NUMBER;
    else if (name == "boolean") out = DataType::BOOLEAN;
    else if (name == "object") out = DataType::OBJECT;
    else if (name == "array") out = DataType::ARRAY;
    else if (name == "null") out = DataType::NUL;
    else return false;
    return true;
}

} // namespace

SchemaValidator::SchemaValidator(std::shared_ptr<const qb::json> document,
                                 std::shared_ptr<const FormatMap> custom_formats)
    : _document(std::move(document)),
      _custom_formats(std::move(custom_formats)),
      _resolver(*_document) {
    prepare(*_document);
}

SchemaValidator::SchemaValidator(const qb::json &document, std::shared_ptr<const FormatMap> custom_formats)
    : SchemaValidator(std::make_shared<const qb::json>(document), std::move(custom_formats)) {}

void SchemaValidator::prepare(const qb::json &node) {
    if (node.is_array()) {
        for (const auto &item : node) prepare(item);
        return;
    }
    if (!node.is_object()) return;

    for (auto const &[key, value] : node.items()) {
        if (key == "enum" || key == "const" || key == "default" || key == "examples") continue;
        if (key == "$ref" && value.is_string()) {
            (void) _resolver.resolve(value.get<std::string>());
        } else if (key == "pattern" && value.is_string()) {
            const auto text = value.get<std::string>();
            if (_patterns.find(text) == _patterns.end()) {
                try {
                    _patterns.emplace(text, std::regex(text, kRegexFlags));
                } catch (const std::regex_error &e) {
                    throw SchemaError("Invalid regex pattern in schema: '" + text + "'. Error: " + e.what());
                }
            }
        } else if (key == "patternProperties" && value.is_object()) {
            for (auto const &[pattern, _] : value.items()) {
                if (_patterns.find(pattern) != _patterns.end()) continue;
                try {
                    _patterns.emplace(pattern, std::regex(pattern, kRegexFlags));
                } catch (const std::regex_error &e) {
                    throw SchemaError("Invalid patternProperties regex: '" + pattern + "'. Error: " + e.what());
                }
            }
        }
        prepare(value);
    }
}

bool SchemaValidator::search(const std::string &pattern, const std::string &text) const {
    const auto it = _patterns.find(pattern);
    if (it != _patterns.end()) {
        return std::regex_search(text, it->second);
    }
    try {
        return std::regex_search(text, std::regex(pattern, kRegexFlags));
    } catch (const std::regex_error &) {
        LOG_VALIDATION_DEBUG("Ignoring invalid regex '" << pattern << "' outside of the prepared document.");
        return false;
    }
}

bool SchemaValidator::validate(const qb::json &data, Result &result) const {
    return validate_recursive(data, *_document, "", result, 0);
}

bool SchemaValidator::validate(const qb::json &data, const qb::json &schema_node, const std::string &path,
                               Result &result) const {
    return validate_recursive(data, schema_node, path, result, 0);
}

bool SchemaValidator::is_valid(const qb::json &data, const qb::json &schema_node) const {
    Result scratch;
    return validate_recursive(data, schema_node, "", scratch, 0);
}

bool SchemaValidator::validate_recursive(const qb::json &value,
                                         const qb::json &schema,
                                         const std::string &path,
                                         Result &result,
                                         std::size_t depth) const {
    if (schema.is_boolean()) {
        if (schema.get<bool>()) return true;
        result.add_error(path, "false", "No value is allowed by this schema.", value);
        return false;
    }
    if (!schema.is_object()) {
        result.add_error(path.empty() ? "_schema" : path + "._schema", "invalidSchemaType",
                         "Schema definition at this level must be an object or a boolean.", schema);
        return false;
    }
    if (depth > kMaxSchemaDepth) {
        result.add_error(path, "schemaDepth", "Schema nesting is too deep (possible $ref loop).", value);
        return false;
    }

    // draft-07: keywords beside $ref are ignored
    const std::string ref = RefResolver::ref_of(schema);
    if (!ref.empty()) {
        return validate_recursive(value, _resolver.resolve(ref), path, result, depth + 1);
    }

    const std::size_t errors_before = result.errors().size();

    bool type_ok = true;
    if (const auto *type_def = member(schema, "type")) {
        type_ok = validate_type_keyword(value, *type_def, path, result);
    }

    if (const auto *allowed = member(schema, "enum")) {
        if (allowed->is_array() && std::find(allowed->begin(), allowed->end(), value) == allowed->end()) {
            result.add_error(path, codes::ENUM, "Value must be one of: " + allowed->dump() + ".", value);
        }
    }
    if (const auto *expected = member(schema, "const")) {
        if (value != *expected) {
            result.add_error(path, codes::CONST, "Value must be " + expected->dump() + ".", value);
        }
    }

    if (type_ok) {
        if (value.is_string()) validate_string_keywords(value, schema, path, result);
        else if (value.is_number()) validate_number_keywords(value, schema, path, result);
        else if (value.is_object()) validate_object_keywords(value, schema, path, result, depth);
        else if (value.is_array()) validate_array_keywords(value, schema, path, result, depth);
    }

    validate_logical_keywords(value, schema, path, result, depth);

    return result.errors().size() == errors_before;
}

bool SchemaValidator::validate_type_keyword(const qb::json &value, const qb::json &type_def,
                                            const std::string &path, Result &result) const {
    if (type_def.is_string()) {
        DataType dt = DataType::ANY;
        if (!parse_type_name(type_def.get<std::string>(), dt)) {
            result.add_error(path, codes::TYPE, "Unknown type specified in schema: " + type_def.get<std::string>(),
                             type_def);
            return false;
        }
        if (!matches_type(value, dt)) {
            result.add_error(path, codes::TYPE, "Invalid type. Expected " + data_type_to_string(dt) + ".", value);
            return false;
        }
        return true;
    }
    if (type_def.is_array()) {
        for (const auto &option : type_def) {
            DataType dt = DataType::ANY;
            if (option.is_string() && parse_type_name(option.get<std::string>(), dt) && matches_type(value, dt)) {
                return true;
            }
        }
        result.add_error(path, codes::TYPE, "Value does not match any of the allowed types: " + type_def.dump(),
                         value);
        return false;
    }
    result.add_error(path, codes::TYPE, "Schema 'type' keyword must be a string or an array of strings.", type_def);
    return false;
}

bool SchemaValidator::validate_string_keywords(const qb::json &value, const qb::json &schema,
                                               const std::string &path, Result &result) const {
    bool ok = true;
    const auto &text = value.get_ref<const std::string &>();
    const std::size_t length = utf8_length(text);

    if (const auto *min = member(schema, "minLength"); min && min->is_number() && length < min->get<double>()) {
        result.add_error(path, codes::MIN_LENGTH,
                         "String too short. Minimum length is " + format_number(min->get<double>()) + ".", value);
        ok = false;
    }
    if (const auto *max = member(schema, "maxLength"); max && max->is_number() && length > max->get<double>()) {
        result.add_error(path, codes::MAX_LENGTH,
                         "String too long. Maximum length is " + format_number(max->get<double>()) + ".", value);
        ok = false;
    }
    if (const auto *pattern = member(schema, "pattern"); pattern && pattern->is_string()) {
        if (!search(pattern->get<std::string>(), text)) {
            result.add_error(path, codes::PATTERN, "String does not match pattern: " + pattern->get<std::string>(),
                             value);
            ok = false;
        }
    }
    if (const auto *format = member(schema, "format"); format && format->is_string()) {
        if (!formats::check(format->get<std::string>(), text, _custom_formats.get())) {
            result.add_error(path, codes::FORMAT,
                             "String does not match format '" + format->get<std::string>() + "'.", value);
            ok = false;
        }
    }
    if (const auto *encoding = member(schema, "contentEncoding"); encoding && *encoding == "base64") {
        if (!formats::is_base64(text)) {
            result.add_error(path, codes::CONTENT_ENCODING, "String is not valid base64 content.", value);
            ok = false;
        }
    }
    if (const auto *media = member(schema, "contentMediaType"); media && *media == "application/json") {
        if (!qb::json::accept(text)) {
            result.add_error(path, codes::CONTENT_MEDIA_TYPE, "String is not valid application/json content.", value);
            ok = false;
        }
    }
    return ok;
}

bool SchemaValidator::validate_number_keywords(const qb::json &value, const qb::json &schema,
                                               const std::string &path, Result &result) const {
    bool ok = true;
    const double number = value.get<double>();
    const auto *minimum = member(schema, "minimum");
    const auto *maximum = member(schema, "maximum");
    const auto *exclusive_min = member(schema, "exclusiveMinimum");
    const auto *exclusive_max = member(schema, "exclusiveMaximum");

    if (minimum && minimum->is_number()) {
        const double bound = minimum->get<double>();
        // legacy draft-04 form: exclusiveMinimum is a flag on minimum
        const bool exclusive = exclusive_min && exclusive_min->is_boolean() && exclusive_min->get<bool>();
        if (exclusive ? number <= bound : number < bound) {
            result.add_error(path, codes::MINIMUM,
                             std::string(exclusive ? "Value must be greater than " : "Value must be greater than or equal to ") +
                                 format_number(bound) + ".",
                             value);
            ok = false;
        }
    }
    if (exclusive_min && exclusive_min->is_number() && number <= exclusive_min->get<double>()) {
        result.add_error(path, codes::MINIMUM,
                         "Value must be greater than " + format_number(exclusive_min->get<double>()) + ".", value);
        ok = false;
    }
    if (maximum && maximum->is_number()) {
        const double bound = maximum->get<double>();
        const bool exclusive = exclusive_max && exclusive_max->is_boolean() && exclusive_max->get<bool>();
        if (exclusive ? number >= bound : number > bound) {
            result.add_error(path, codes::MAXIMUM,
                             std::string(exclusive ? "Value must be less than " : "Value must be less than or equal to ") +
                                 format_number(bound) + ".",
                             value);
            ok = false;
        }
    }
    if (exclusive_max && exclusive_max->is_number() && number >= exclusive_max->get<double>()) {
        result.add_error(path, codes::MAXIMUM,
                         "Value must be less than " + format_number(exclusive_max->get<double>()) + ".", value);
        ok = false;
    }
    if (const auto *divisor = member(schema, "multipleOf"); divisor && divisor->is_number()) {
        if (!is_multiple_of(number, divisor->get<double>())) {
            result.add_error(path, codes::MULTIPLE_OF,
                             "Value must be a multiple of " + format_number(divisor->get<double>()) + ".", value);
            ok = false;
        }
    }
    return ok;
}

bool SchemaValidator::validate_object_keywords(const qb::json &value, const qb::json &schema,
                                               const std::string &path, Result &result, std::size_t depth) const {
    const std::size_t errors_before = result.errors().size();
    const auto *properties = member(schema, "properties");
    const auto *pattern_properties = member(schema, "patternProperties");

    if (properties && properties->is_object()) {
        for (auto const &[name, sub_schema] : properties->items()) {
            const auto it = value.find(name);
            if (it != value.end()) {
                validate_recursive(*it, sub_schema, child_path(path, name), result, depth + 1);
            }
        }
    }

    if (const auto *required = member(schema, "required"); required && required->is_array()) {
        for (const auto &name : *required) {
            if (name.is_string() && !value.contains(name.get<std::string>())) {
                result.add_error(child_path(path, name.get<std::string>()), codes::REQUIRED, "Property is required.");
            }
        }
    }

    if (pattern_properties && pattern_properties->is_object()) {
        for (auto const &[key, item] : value.items()) {
            for (auto const &[pattern, sub_schema] : pattern_properties->items()) {
                if (search(pattern, key)) {
                    validate_recursive(item, sub_schema, child_path(path, key), result, depth + 1);
                }
            }
        }
    }

    if (const auto *additional = member(schema, "additionalProperties")) {
        for (auto const &[key, item] : value.items()) {
            if (properties && properties->is_object() && properties->contains(key)) continue;
            bool matched = false;
            if (pattern_properties && pattern_properties->is_object()) {
                for (auto const &[pattern, _] : pattern_properties->items()) {
                    if (search(pattern, key)) {
                        matched = true;
                        break;
                    }
                }
            }
            if (matched) continue;
            if (additional->is_boolean()) {
                if (!additional->get<bool>()) {
                    result.add_error(child_path(path, key), codes::ADDITIONAL_PROPERTIES,
                                     "Additional property '" + key + "' not allowed.", item);
                }
            } else {
                validate_recursive(item, *additional, child_path(path, key), result, depth + 1);
            }
        }
    }

    if (const auto *names = member(schema, "propertyNames")) {
        for (auto const &[key, _] : value.items()) {
            Result name_result;
            if (!validate_recursive(qb::json(key), *names, "", name_result, depth + 1)) {
                result.add_error(child_path(path, key), "propertyNames",
                                 "Property name '" + key + "' failed validation: " +
                                     name_result.errors().front().message,
                                 qb::json(key));
            }
        }
    }

    if (const auto *min = member(schema, "minProperties"); min && min->is_number() && value.size() < min->get<double>()) {
        result.add_error(path, codes::MIN_PROPERTIES,
                         "Object must have at least " + format_number(min->get<double>()) + " properties.", value);
    }
    if (const auto *max = member(schema, "maxProperties"); max && max->is_number() && value.size() > max->get<double>()) {
        result.add_error(path, codes::MAX_PROPERTIES,
                         "Object must have at most " + format_number(max->get<double>()) + " properties.", value);
    }

    auto check_dependent_required = [&](const std::string &trigger, const qb::json &names) {
        if (!value.contains(trigger) || !names.is_array()) return;
        for (const auto &name : names) {
            if (name.is_string() && !value.contains(name.get<std::string>())) {
                result.add_error(child_path(path, name.get<std::string>()), "dependentRequired",
                                 "Property is required when '" + trigger + "' is present.");
            }
        }
    };
    auto check_dependent_schema = [&](const std::string &trigger, const qb::json &sub_schema) {
        if (!value.contains(trigger)) return;
        validate_recursive(value, sub_schema, path, result, depth + 1);
    };

    if (const auto *dependent = member(schema, "dependentRequired"); dependent && dependent->is_object()) {
        for (auto const &[trigger, names] : dependent->items()) check_dependent_required(trigger, names);
    }
    if (const auto *dependent = member(schema, "dependentSchemas"); dependent && dependent->is_object()) {
        for (auto const &[trigger, sub_schema] : dependent->items()) check_dependent_schema(trigger, sub_schema);
    }
    if (const auto *dependencies = member(schema, "dependencies"); dependencies && dependencies->is_object()) {
        for (auto const &[trigger, dependency] : dependencies->items()) {
            if (dependency.is_array()) check_dependent_required(trigger, dependency);
            else check_dependent_schema(trigger, dependency);
        }
    }

    return result.errors().size() == errors_before;
}

bool SchemaValidator::validate_array_keywords(const qb::json &value, const qb::json &schema,
                                              const std::string &path, Result &result, std::size_t depth) const {
    const std::size_t errors_before = result.errors().size();

    if (const auto *items = member(schema, "items")) {
        if (items->is_array()) {
            const auto *additional = member(schema, "additionalItems");
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (i < items->size()) {
                    validate_recursive(value[i], (*items)[i], index_path(path, i), result, depth + 1);
                } else if (additional) {
                    if (additional->is_boolean() && !additional->get<bool>()) {
                        result.add_error(index_path(path, i), "additionalItems", "Additional items not allowed.",
                                         value[i]);
                        break;
                    }
                    validate_recursive(value[i], *additional, index_path(path, i), result, depth + 1);
                }
            }
        } else {
            for (std::size_t i = 0; i < value.size(); ++i) {
                validate_recursive(value[i], *items, index_path(path, i), result, depth + 1);
            }
        }
    }

    if (const auto *min = member(schema, "minItems"); min && min->is_number() && value.size() < min->get<double>()) {
        result.add_error(path, codes::MIN_ITEMS,
                         "Array must contain at least " + format_number(min->get<double>()) + " items.", value);
    }
    if (const auto *max = member(schema, "maxItems"); max && max->is_number() && value.size() > max->get<double>()) {
        result.add_error(path, codes::MAX_ITEMS,
                         "Array must contain at most " + format_number(max->get<double>()) + " items.", value);
    }
    if (const auto *unique = member(schema, "uniqueItems"); unique && unique->is_boolean() && unique->get<bool>()) {
        qb::unordered_set<qb::json> seen_items;
        for (const auto &item : value) {
            if (!seen_items.insert(item).second) {
                result.add_error(path, codes::UNIQUE_ITEMS, "Array items must be unique.", value);
                break;
            }
        }
    }
    if (const auto *contains = member(schema, "contains")) {
        bool found = false;
        for (const auto &item : value) {
            Result scratch;
            if (validate_recursive(item, *contains, path, scratch, depth + 1)) {
                found = true;
                break;
            }
        }
        if (!found) {
            result.add_error(path, codes::CONTAINS, "Array must contain at least one matching item.", value);
        }
    }

    return result.errors().size() == errors_before;
}

bool SchemaValidator::validate_logical_keywords(const qb::json &value, const qb::json &schema,
                                                const std::string &path, Result &result, std::size_t depth) const {
    bool ok = true;

    if (const auto *all_of = member(schema, "allOf"); all_of && all_of->is_array()) {
        bool all_passed = true;
        for (const auto &sub_schema : *all_of) {
            if (!validate_recursive(value, sub_schema, path, result, depth + 1)) all_passed = false;
        }
        if (!all_passed) {
            result.add_error(path, "allOf", "Value does not validate against all specified schemas.", value);
            ok = false;
        }
    }
    if (const auto *any_of = member(schema, "anyOf"); any_of && any_of->is_array()) {
        bool any_passed = false;
        for (const auto &sub_schema : *any_of) {
            Result scratch;
            if (validate_recursive(value, sub_schema, path, scratch, depth + 1)) {
                any_passed = true;
                break;
            }
        }
        if (!any_passed) {
            result.add_error(path, "anyOf", "Value does not validate against any of the specified schemas.", value);
            ok = false;
        }
    }
    if (const auto *one_of = member(schema, "oneOf"); one_of && one_of->is_array()) {
        std::size_t matches = 0;
        for (const auto &sub_schema : *one_of) {
            Result scratch;
            if (validate_recursive(value, sub_schema, path, scratch, depth + 1)) ++matches;
        }
        if (matches != 1) {
            result.add_error(path, "oneOf",
                             "Value must validate against exactly one of the specified schemas (matched " +
                                 std::to_string(matches) + ").",
                             value);
            ok = false;
        }
    }
    if (const auto *not_def = member(schema, "not")) {
        Result scratch;
        if (validate_recursive(value, *not_def, path, scratch, depth + 1)) {
            result.add_error(path, "not", "Value must not validate against the specified schema.", value);
            ok = false;
        }
    }
    if (const auto *if_def = member(schema, "if")) {
        Result scratch;
        const bool condition = validate_recursive(value, *if_def, path, scratch, depth + 1);
        const auto *branch = member(schema, condition ? "then" : "else");
        if (branch && !validate_recursive(value, *branch, path, result, depth + 1)) {
            ok = false;
        }
    }
    return ok;
}

} // namespace qb::validation::jsonschema
