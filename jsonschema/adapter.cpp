/**
 * @file qbm/validation/jsonschema/adapter.cpp
 * @brief Expansion of DSL records into rule chains.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./adapter.h"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <regex>
#include <utility>
#include "../config.h"
#include "../logger.h"
#include "../path/field_path.h"
#include "../rule/predicates.h"
#include "./error.h"
#include "./schema_validator.h"

namespace qb::validation::jsonschema {
namespace {

/// Runs a sub-schema check on a defined value, reporting below `path`.
using SchemaRun = std::function<bool(const qb::json &value, const std::string &path, Result &result)>;

MessageFn fixed(std::string text) {
    return [text = std::move(text)](const MessageContext &) { return text; };
}

std::size_t count_of(const qb::json &constraints, const char *keyword) {
    const auto &value = constraints.at(keyword);
    if (!value.is_number() || value.get<double>() < 0) {
        throw SchemaError(std::string("'") + keyword + "' must be a non-negative number.");
    }
    if (value.is_number_unsigned()) {
        const auto count = value.get<std::uint64_t>();
        if (count > std::numeric_limits<std::size_t>::max()) return std::numeric_limits<std::size_t>::max();
        return static_cast<std::size_t>(count);
    }
    // bounds past the size_t range are unreachable by any document
    const double count = value.get<double>();
    if (count >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(count);
}

double number_of(const qb::json &constraints, const char *keyword) {
    const auto &value = constraints.at(keyword);
    if (!value.is_number()) {
        throw SchemaError(std::string("'") + keyword + "' must be a number.");
    }
    return value.get<double>();
}

std::regex compile_property_pattern(const std::string &pattern) {
    try {
        return std::regex(pattern, std::regex_constants::ECMAScript | std::regex_constants::optimize);
    } catch (const std::regex_error &e) {
        throw SchemaError("Invalid property pattern: '" + pattern + "'. Error: " + e.what());
    }
}

DataType data_type_of(const std::string &name) {
    if (name == "string") return DataType::STRING;
    if (name == "integer") return DataType::INTEGER;
    if (name == "number") return DataType::NUMBER;
    if (name == "boolean") return DataType::BOOLEAN;
    if (name == "object") return DataType::OBJECT;
    if (name == "array") return DataType::ARRAY;
    if (name == "null") return DataType::NUL;
    throw SchemaError("Unknown type specified in schema: " + name);
}

DataType data_type_of(DslType type) {
    switch (type) {
        case DslType::String: return DataType::STRING;
        case DslType::Number: return DataType::NUMBER;
        case DslType::Boolean: return DataType::BOOLEAN;
        case DslType::Array:
        case DslType::Tuple: return DataType::ARRAY;
        case DslType::Object: return DataType::OBJECT;
        case DslType::Null: return DataType::NUL;
        case DslType::Any: return DataType::ANY;
    }
    return DataType::ANY;
}

class RuleExpander {
private:
    std::shared_ptr<const SchemaValidator> _schemas;
    const Options &_options;

    /**
     * @brief Rule whose verdict is a sub-schema run. The message is the first
     *        nested error, recomputed only when the rule failed.
     */
    static Rule schema_rule(std::string code, SchemaRun run, std::string fallback_message,
                            RuleKind kind = RuleKind::Base) {
        auto check = [run](const qb::json *value, const EvalContext &) {
            if (!value) return true;
            Result scratch;
            return run(*value, "", scratch);
        };
        auto message = [run, fallback = std::move(fallback_message)](const MessageContext &ctx) {
            if (!ctx.value) return fallback;
            Result scratch;
            run(*ctx.value, ctx.path, scratch);
            if (scratch.errors().empty()) return fallback;
            const auto &first = scratch.errors().front();
            if (first.field_path.empty() || first.field_path == ctx.path) return first.message;
            return first.field_path + ": " + first.message;
        };
        if (kind == RuleKind::Conditional) {
            return Rule::conditional(std::move(code), std::move(check), std::move(message));
        }
        return Rule::base(std::move(code), std::move(check), std::move(message));
    }

    /// Rule satisfied when `value` validates against `schema`.
    Rule matches(std::string code, const qb::json &schema, std::string fallback_message) const {
        auto schemas = _schemas;
        return schema_rule(std::move(code),
                           [schemas, schema](const qb::json &value, const std::string &path, Result &result) {
                               return schemas->validate(value, schema, path, result);
                           },
                           std::move(fallback_message));
    }

    Rule required_rule() const {
        const bool strict = _options.strict_required();
        return Rule::conditional(codes::REQUIRED,
                                 [strict](const qb::json *value, const EvalContext &ctx) {
                                     // no parent object, nothing to require
                                     if (!ctx.parent) return true;
                                     if (!value) return false;
                                     if (strict) return true;
                                     if (value->is_null()) return false;
                                     return !(value->is_string() && value->get_ref<const std::string &>().empty());
                                 },
                                 fixed("Field is required."));
    }

    void add_type_rules(const DslRecord &record, std::vector<Rule> &chain) const {
        const auto &c = record.constraints;
        if (record.explicit_type) {
            if (c.contains("types")) {
                std::vector<DataType> types;
                for (const auto &name : c.at("types")) types.push_back(data_type_of(name.get<std::string>()));
                chain.push_back(rules::type_union(std::move(types)));
            } else if (record.type != DslType::Any) {
                chain.push_back(rules::type(data_type_of(record.type)));
            }
        }
        if (c.value("integer", false)) chain.push_back(rules::integer());
    }

    void add_string_rules(const qb::json &c, std::vector<Rule> &chain) const {
        if (c.contains("minLength")) chain.push_back(rules::min_length(count_of(c, "minLength")));
        if (c.contains("maxLength")) chain.push_back(rules::max_length(count_of(c, "maxLength")));
        if (c.contains("pattern")) {
            try {
                chain.push_back(rules::pattern(c.at("pattern").get<std::string>()));
            } catch (const std::invalid_argument &e) {
                throw SchemaError(e.what());
            }
        }
        if (c.contains("format") && c.at("format").is_string()) {
            chain.push_back(rules::format(c.at("format").get<std::string>(), {}, _options.custom_formats()));
        }
        if (c.contains("contentEncoding") && c.at("contentEncoding").is_string()) {
            chain.push_back(rules::content_encoding(c.at("contentEncoding").get<std::string>()));
        }
        if (c.contains("contentMediaType") && c.at("contentMediaType").is_string()) {
            chain.push_back(rules::content_media_type(c.at("contentMediaType").get<std::string>()));
        }
    }

    void add_number_rules(const qb::json &c, std::vector<Rule> &chain) const {
        if (c.contains("minimum")) chain.push_back(rules::minimum(number_of(c, "minimum"), false));
        if (c.contains("exclusiveMinimum")) chain.push_back(rules::minimum(number_of(c, "exclusiveMinimum"), true));
        if (c.contains("maximum")) chain.push_back(rules::maximum(number_of(c, "maximum"), false));
        if (c.contains("exclusiveMaximum")) chain.push_back(rules::maximum(number_of(c, "exclusiveMaximum"), true));
        if (c.contains("multipleOf")) {
            try {
                chain.push_back(rules::multiple_of(number_of(c, "multipleOf")));
            } catch (const std::invalid_argument &e) {
                throw SchemaError(e.what());
            }
        }
    }

    void add_array_rules(const qb::json &c, std::vector<Rule> &chain) const {
        if (c.contains("minItems")) chain.push_back(rules::min_items(count_of(c, "minItems")));
        if (c.contains("maxItems")) chain.push_back(rules::max_items(count_of(c, "maxItems")));
        if (c.value("uniqueItems", false)) chain.push_back(rules::unique_items());
        if (c.contains("contains")) {
            auto schemas = _schemas;
            const qb::json schema = c.at("contains");
            chain.push_back(rules::contains(
                [schemas, schema](const qb::json &item) { return schemas->is_valid(item, schema); }));
        }
        if (c.contains("items") && c.at("items").is_array()) {
            add_tuple_rules(c, chain);
        }
    }

    // Positions become a tuple rule; JSON Schema tuples may be shorter or longer than `items`.
    void add_tuple_rules(const qb::json &c, std::vector<Rule> &chain) const {
        const auto &positions = c.at("items");
        std::vector<std::vector<Rule>> position_chains;
        position_chains.reserve(positions.size());
        for (std::size_t i = 0; i < positions.size(); ++i) {
            position_chains.push_back(
                {matches("items", positions[i], "Tuple item " + std::to_string(i) + " is invalid.")});
        }
        TupleOptions shape;
        shape.allow_shorter = true;
        shape.allow_extra = true;
        chain.push_back(rules::tuple(std::move(position_chains), std::move(shape), RuleOptions("items")));

        if (!c.contains("additionalItems")) return;
        const std::size_t length = positions.size();
        const qb::json additional = c.at("additionalItems");
        if (additional.is_boolean()) {
            if (additional.get<bool>()) return;
            chain.push_back(Rule::base(
                "additionalItems",
                [length](const qb::json *value, const EvalContext &) {
                    return !value || !value->is_array() || value->size() <= length;
                },
                fixed("Array must contain at most " + std::to_string(length) + " items.")));
            return;
        }
        auto schemas = _schemas;
        chain.push_back(schema_rule(
            "additionalItems",
            [schemas, additional, length](const qb::json &value, const std::string &path, Result &result) {
                if (!value.is_array()) return true;
                bool ok = true;
                for (std::size_t i = length; i < value.size(); ++i) {
                    if (!schemas->validate(value[i], additional, path + "[" + std::to_string(i) + "]", result)) {
                        ok = false;
                    }
                }
                return ok;
            },
            "Additional items are invalid."));
    }

    void add_object_rules(const DslRecord &record, std::vector<Rule> &chain) const {
        const auto &c = record.constraints;
        if (c.contains("minProperties")) chain.push_back(rules::min_properties(count_of(c, "minProperties")));
        if (c.contains("maxProperties")) chain.push_back(rules::max_properties(count_of(c, "maxProperties")));

        std::vector<std::string> declared;
        if (c.contains("properties")) {
            for (const auto &name : c.at("properties")) declared.push_back(name.get<std::string>());
        }
        std::vector<std::string> patterns;
        qb::json pattern_schemas = qb::json::object();
        if (c.contains("patternProperties") && c.at("patternProperties").is_object()) {
            pattern_schemas = c.at("patternProperties");
            for (auto const &[pattern, _] : pattern_schemas.items()) patterns.push_back(pattern);
        }

        auto compiled = std::make_shared<std::vector<std::pair<std::regex, qb::json>>>();
        for (auto const &[pattern, schema] : pattern_schemas.items()) {
            compiled->emplace_back(compile_property_pattern(pattern), schema);
        }
        std::shared_ptr<const std::vector<std::pair<std::regex, qb::json>>> pattern_rules = std::move(compiled);

        if (!pattern_rules->empty()) {
            auto schemas = _schemas;
            chain.push_back(schema_rule(
                "patternProperties",
                [schemas, pattern_rules](const qb::json &value, const std::string &path, Result &result) {
                    if (!value.is_object()) return true;
                    bool ok = true;
                    for (const auto &[re, schema] : *pattern_rules) {
                        for (auto const &[key, item] : value.items()) {
                            if (std::regex_search(key, re) &&
                                !schemas->validate(item, schema, FieldPath::join(path, key), result)) {
                                ok = false;
                            }
                        }
                    }
                    return ok;
                },
                "Properties matching a pattern are invalid."));
        }

        std::optional<qb::json> additional;
        if (c.contains("additionalProperties")) additional = c.at("additionalProperties");
        const auto &override_value = _options.allow_additional_properties();
        if (override_value && c.contains("properties") && (!additional || additional->is_boolean())) {
            additional = *override_value;
        }
        if (additional && additional->is_boolean()) {
            if (!additional->get<bool>()) {
                try {
                    chain.push_back(rules::allowed_properties(declared, patterns));
                } catch (const std::invalid_argument &e) {
                    throw SchemaError(e.what());
                }
            }
        } else if (additional) {
            auto schemas = _schemas;
            const qb::json schema = *additional;
            chain.push_back(schema_rule(
                codes::ADDITIONAL_PROPERTIES,
                [schemas, schema, declared, pattern_rules](const qb::json &value, const std::string &path,
                                                           Result &result) {
                    if (!value.is_object()) return true;
                    bool ok = true;
                    for (auto const &[key, item] : value.items()) {
                        if (std::find(declared.begin(), declared.end(), key) != declared.end()) continue;
                        const bool matched =
                            std::any_of(pattern_rules->begin(), pattern_rules->end(),
                                        [&key](const auto &entry) { return std::regex_search(key, entry.first); });
                        if (!matched && !schemas->validate(item, schema, FieldPath::join(path, key), result)) {
                            ok = false;
                        }
                    }
                    return ok;
                },
                "Additional properties are invalid."));
        }

        if (c.contains("propertyNames")) {
            auto schemas = _schemas;
            const qb::json schema = c.at("propertyNames");
            chain.push_back(schema_rule(
                "propertyNames",
                [schemas, schema](const qb::json &value, const std::string &path, Result &result) {
                    if (!value.is_object()) return true;
                    bool ok = true;
                    for (auto const &[key, _] : value.items()) {
                        Result name_result;
                        if (!schemas->validate(qb::json(key), schema, "", name_result)) {
                            result.add_error(FieldPath::join(path, key), "propertyNames",
                                             "Property name '" + key + "' failed validation: " +
                                                 name_result.errors().front().message,
                                             qb::json(key));
                            ok = false;
                        }
                    }
                    return ok;
                },
                "Property names are invalid."));
        }

        if (c.contains("dependentSchemas")) {
            auto schemas = _schemas;
            for (auto const &[trigger, schema] : c.at("dependentSchemas").items()) {
                chain.push_back(schema_rule(
                    "dependentSchemas",
                    [schemas, trigger = std::string(trigger), schema = qb::json(schema)](
                        const qb::json &value, const std::string &path, Result &result) {
                        if (!value.is_object() || !value.contains(trigger)) return true;
                        return schemas->validate(value, schema, path, result);
                    },
                    "Object does not satisfy the schema required by '" + std::string(trigger) + "'.",
                    RuleKind::Conditional));
            }
        }
    }

    void add_value_rules(const qb::json &c, std::vector<Rule> &chain) const {
        if (c.contains("enum")) {
            try {
                chain.push_back(rules::one_of(c.at("enum")));
            } catch (const std::invalid_argument &e) {
                throw SchemaError(e.what());
            }
        }
        if (c.contains("const")) chain.push_back(rules::literal(c.at("const")));
    }

    void add_logical_rules(const qb::json &c, std::vector<Rule> &chain) const {
        auto schemas = _schemas;
        if (c.contains("allOf") && c.at("allOf").is_array()) {
            const qb::json branches = c.at("allOf");
            chain.push_back(schema_rule(
                "allOf",
                [schemas, branches](const qb::json &value, const std::string &path, Result &result) {
                    bool ok = true;
                    for (const auto &branch : branches) {
                        if (!schemas->validate(value, branch, path, result)) ok = false;
                    }
                    return ok;
                },
                "Value does not validate against all specified schemas."));
        }
        if (c.contains("anyOf") && c.at("anyOf").is_array()) {
            const qb::json branches = c.at("anyOf");
            chain.push_back(Rule::base(
                "anyOf",
                [schemas, branches](const qb::json *value, const EvalContext &) {
                    if (!value) return true;
                    for (const auto &branch : branches) {
                        if (schemas->is_valid(*value, branch)) return true;
                    }
                    return false;
                },
                fixed("Value does not validate against any of the specified schemas.")));
        }
        if (c.contains("oneOf") && c.at("oneOf").is_array()) {
            const qb::json branches = c.at("oneOf");
            auto count_matches = [schemas, branches](const qb::json &value) {
                std::size_t matched = 0;
                for (const auto &branch : branches) {
                    if (schemas->is_valid(value, branch)) ++matched;
                }
                return matched;
            };
            chain.push_back(Rule::base(
                "oneOf",
                [count_matches](const qb::json *value, const EvalContext &) {
                    return !value || count_matches(*value) == 1;
                },
                [count_matches](const MessageContext &ctx) {
                    const std::size_t matched = ctx.value ? count_matches(*ctx.value) : 0;
                    return "Value must validate against exactly one of the specified schemas (matched " +
                           std::to_string(matched) + ").";
                }));
        }
        if (c.contains("not")) {
            const qb::json schema = c.at("not");
            chain.push_back(Rule::base(
                "not",
                [schemas, schema](const qb::json *value, const EvalContext &) {
                    return !value || !schemas->is_valid(*value, schema);
                },
                fixed("Value must not validate against the specified schema.")));
        }
        if (c.contains("conditional")) {
            const qb::json bundle = c.at("conditional");
            chain.push_back(schema_rule(
                "conditional",
                [schemas, bundle](const qb::json &value, const std::string &path, Result &result) {
                    const bool condition = schemas->is_valid(value, bundle.at("if"));
                    const char *branch = condition ? "then" : "else";
                    if (!bundle.contains(branch)) return true;
                    return schemas->validate(value, bundle.at(branch), path, result);
                },
                "Value does not satisfy the conditional schema.", RuleKind::Conditional));
        }
    }

public:
    RuleExpander(std::shared_ptr<const SchemaValidator> schemas, const Options &options)
        : _schemas(std::move(schemas)), _options(options) {}

    std::vector<Rule> chain_for(const DslRecord &record) const {
        const auto &c = record.constraints;
        std::vector<Rule> chain;
        if (record.nullable) chain.push_back(rules::nullable());
        if (c.value("required", false)) chain.push_back(required_rule());

        add_type_rules(record, chain);
        add_string_rules(c, chain);
        add_number_rules(c, chain);
        add_array_rules(c, chain);
        add_object_rules(record, chain);
        add_value_rules(c, chain);
        add_logical_rules(c, chain);

        if (c.value("readOnly", false)) chain.push_back(rules::read_only());
        if (c.value("writeOnly", false)) chain.push_back(rules::write_only());

        if (c.contains("$ref")) {
            // cyclic reference that does not loop back to the root: checked lazily
            const qb::json reference = {{"$ref", c.at("$ref")}};
            chain.push_back(matches("$ref", reference, "Value does not match the referenced schema."));
        }
        if (record.recursion) {
            chain.push_back(rules::recursively(*record.recursion, _options.max_recursion_depth()));
        }
        return chain;
    }

    /// One definition per property listed by `dependentRequired`.
    void dependent_fields(const DslRecord &record, std::vector<FieldDefinition> &out) const {
        const auto it = record.constraints.find("dependentRequired");
        if (it == record.constraints.end()) return;
        for (auto const &[trigger, names] : it->items()) {
            if (!names.is_array()) continue;
            for (const auto &name : names) {
                if (!name.is_string()) continue;
                const std::string dependent = name.get<std::string>();
                const std::string trigger_name = trigger;
                Rule rule = Rule::conditional(
                    "dependentRequired",
                    [trigger_name](const qb::json *value, const EvalContext &ctx) {
                        if (!ctx.parent || !ctx.parent->is_object() || !ctx.parent->contains(trigger_name)) {
                            return true;
                        }
                        return value != nullptr;
                    },
                    fixed("Property '" + dependent + "' is required when '" + trigger_name + "' is present."));
                out.emplace_back(property_path(record.path, dependent), std::vector<Rule>{std::move(rule)});
            }
        }
    }
};

} // namespace

std::vector<FieldDefinition> to_field_definitions(const std::vector<DslRecord> &records,
                                                  const qb::json &document,
                                                  const Options &options) {
    auto schemas = std::make_shared<const SchemaValidator>(document, options.custom_formats());
    RuleExpander expander(schemas, options);

    std::vector<FieldDefinition> definitions;
    definitions.reserve(records.size());
    for (const auto &record : records) {
        definitions.emplace_back(record.path, expander.chain_for(record));
        expander.dependent_fields(record, definitions);
    }
    return definitions;
}

Validator from_json_schema(const qb::json &schema, const Options &options) {
    if (!schema.is_object() && !schema.is_boolean()) {
        throw SchemaError("JSON Schema must be an object or a boolean.");
    }
    const auto records = to_dsl(schema);
    auto definitions = to_field_definitions(records, schema, options);
    LOG_VALIDATION_INFO("JSON Schema converted: " << records.size() << " DSL records, " << definitions.size()
                                                  << " field definitions.");
    return Validator(std::move(definitions));
}

} // namespace qb::validation::jsonschema
