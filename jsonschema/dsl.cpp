/**
 * @file qbm/validation/jsonschema/dsl.cpp
 * @brief Flattening of a JSON Schema graph into DSL records.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./dsl.h"
#include <algorithm>
#include "../config.h"
#include "../logger.h"
#include "../path/field_path.h"
#include "./error.h"
#include "./ref_resolver.h"

namespace qb::validation::jsonschema {

std::string to_string(DslType type) {
    switch (type) {
        case DslType::String: return "string";
        case DslType::Number: return "number";
        case DslType::Boolean: return "boolean";
        case DslType::Array: return "array";
        case DslType::Object: return "object";
        case DslType::Null: return "null";
        case DslType::Tuple: return "tuple";
        case DslType::Any: return "any";
    }
    return "any";
}

namespace {

// Keywords copied verbatim into the record constraints.
const char *const kPlainKeywords[] = {
    "minLength",     "maxLength",      "pattern",         "format",        "contentEncoding",
    "contentMediaType", "multipleOf",  "minItems",        "maxItems",      "contains",
    "minProperties", "maxProperties",  "propertyNames",   "patternProperties",
    "additionalProperties", "enum",    "const",           "allOf",         "anyOf",
    "oneOf",         "not"};

bool map_type_name(const std::string &name, DslType &out) {
    if (name == "string") out = DslType::String;
    else if (name == "number" || name == "integer") out = DslType::Number;
    else if (name == "boolean") out = DslType::Boolean;
    else if (name == "array") out = DslType::Array;
    else if (name == "object") out = DslType::Object;
    else if (name == "null") out = DslType::Null;
    else return false;
    return true;
}

DslType type_of_value(const qb::json &value) {
    if (value.is_string()) return DslType::String;
    if (value.is_number()) return DslType::Number;
    if (value.is_boolean()) return DslType::Boolean;
    if (value.is_array()) return DslType::Array;
    if (value.is_object()) return DslType::Object;
    return DslType::Null;
}

class DslConverter {
private:
    struct Frame {
        const qb::json *node;
        std::string path;
    };

    struct Resolution {
        const qb::json *node = nullptr;
        // Set when the reference loops back on a node being expanded.
        const Frame *cycle = nullptr;
        std::string ref;
    };

    RefResolver _resolver;
    std::string _root_path;
    std::vector<Frame> _stack;
    std::vector<DslRecord> _records;

    Resolution follow(const qb::json &node) const {
        Resolution res;
        res.node = &node;
        for (std::size_t hops = 0;; ++hops) {
            const std::string ref = RefResolver::ref_of(*res.node);
            if (ref.empty()) return res;
            if (hops > kMaxSchemaDepth) {
                throw SchemaError("$ref chain too long at '" + ref + "'.");
            }
            res.ref = ref;
            res.node = &_resolver.resolve(ref);
            for (const auto &frame : _stack) {
                if (frame.node == res.node) {
                    res.cycle = &frame;
                    return res;
                }
            }
        }
    }

    // Only a flattening that starts at the document root can recurse: the
    // nested value becomes the root of the field set.
    bool loops_to_root(const Resolution &res) const {
        return res.cycle && res.cycle == &_stack.front() && _root_path.empty();
    }

    static void describe_type(const qb::json &node, DslRecord &record) {
        const auto type_it = node.find("type");
        if (type_it != node.end() && type_it->is_string()) {
            const auto name = type_it->get<std::string>();
            if (map_type_name(name, record.type)) {
                record.explicit_type = true;
                if (name == "integer") record.constraints["integer"] = true;
            }
        } else if (type_it != node.end() && type_it->is_array()) {
            qb::json names = qb::json::array();
            for (const auto &entry : *type_it) {
                if (!entry.is_string()) continue;
                if (entry == "null") {
                    record.nullable = true;
                } else {
                    names.push_back(entry);
                }
            }
            record.explicit_type = true;
            if (names.empty()) {
                record.type = record.nullable ? DslType::Null : DslType::Any;
                record.nullable = false;
            } else if (names.size() == 1) {
                map_type_name(names[0].get<std::string>(), record.type);
                if (names[0] == "integer") record.constraints["integer"] = true;
            } else {
                map_type_name(names[0].get<std::string>(), record.type);
                for (const auto &name : names) {
                    DslType mapped = DslType::Any;
                    if (map_type_name(name.get<std::string>(), mapped)) record.multiple_types.push_back(mapped);
                }
                record.constraints["types"] = names;
            }
        } else if (const auto enum_it = node.find("enum"); enum_it != node.end() && enum_it->is_array() &&
                                                            !enum_it->empty()) {
            for (const auto &allowed : *enum_it) {
                const DslType t = type_of_value(allowed);
                if (std::find(record.multiple_types.begin(), record.multiple_types.end(), t) ==
                    record.multiple_types.end()) {
                    record.multiple_types.push_back(t);
                }
            }
            record.type = record.multiple_types.front();
            if (record.multiple_types.size() == 1) record.multiple_types.clear();
        } else if (const auto const_it = node.find("const"); const_it != node.end()) {
            record.type = type_of_value(*const_it);
        }
    }

    static void describe_numbers(const qb::json &node, qb::json &constraints) {
        const auto minimum = node.find("minimum");
        const auto maximum = node.find("maximum");
        const auto exclusive_min = node.find("exclusiveMinimum");
        const auto exclusive_max = node.find("exclusiveMaximum");

        if (minimum != node.end() && minimum->is_number()) {
            if (exclusive_min != node.end() && exclusive_min->is_boolean() && exclusive_min->get<bool>()) {
                constraints["exclusiveMinimum"] = *minimum;
            } else {
                constraints["minimum"] = *minimum;
            }
        }
        if (exclusive_min != node.end() && exclusive_min->is_number()) {
            constraints["exclusiveMinimum"] = *exclusive_min;
        }
        if (maximum != node.end() && maximum->is_number()) {
            if (exclusive_max != node.end() && exclusive_max->is_boolean() && exclusive_max->get<bool>()) {
                constraints["exclusiveMaximum"] = *maximum;
            } else {
                constraints["maximum"] = *maximum;
            }
        }
        if (exclusive_max != node.end() && exclusive_max->is_number()) {
            constraints["exclusiveMaximum"] = *exclusive_max;
        }
    }

    static void describe_dependencies(const qb::json &node, qb::json &constraints) {
        qb::json required_by = qb::json::object();
        qb::json schemas_by = qb::json::object();
        if (const auto it = node.find("dependentRequired"); it != node.end() && it->is_object()) {
            required_by = *it;
        }
        if (const auto it = node.find("dependentSchemas"); it != node.end() && it->is_object()) {
            schemas_by = *it;
        }
        if (const auto it = node.find("dependencies"); it != node.end() && it->is_object()) {
            for (auto const &[trigger, dependency] : it->items()) {
                if (dependency.is_array()) {
                    auto &names = required_by[trigger];
                    if (!names.is_array()) names = qb::json::array();
                    for (const auto &name : dependency) names.push_back(name);
                } else {
                    schemas_by[trigger] = dependency;
                }
            }
        }
        if (!required_by.empty()) constraints["dependentRequired"] = std::move(required_by);
        if (!schemas_by.empty()) constraints["dependentSchemas"] = std::move(schemas_by);
    }

    static DslRecord describe(const qb::json &node, const std::string &path) {
        DslRecord record;
        record.path = path;
        if (node.is_boolean()) {
            if (!node.get<bool>()) record.constraints["not"] = qb::json::object();
            return record;
        }
        if (!node.is_object()) {
            throw SchemaError("Schema at '" + path + "' must be an object or a boolean.");
        }

        describe_type(node, record);
        auto &constraints = record.constraints;

        for (const char *keyword : kPlainKeywords) {
            const auto it = node.find(keyword);
            if (it != node.end()) constraints[keyword] = *it;
        }
        describe_numbers(node, constraints);

        if (const auto it = node.find("uniqueItems"); it != node.end() && *it == true) {
            constraints["uniqueItems"] = true;
        }
        if (const auto it = node.find("readOnly"); it != node.end() && *it == true) {
            constraints["readOnly"] = true;
        }
        if (const auto it = node.find("writeOnly"); it != node.end() && *it == true) {
            constraints["writeOnly"] = true;
        }

        if (const auto items = node.find("items"); items != node.end() && items->is_array()) {
            record.type = DslType::Tuple;
            constraints["items"] = *items;
            if (const auto additional = node.find("additionalItems"); additional != node.end()) {
                constraints["additionalItems"] = *additional;
            }
        }

        if (const auto properties = node.find("properties"); properties != node.end() && properties->is_object()) {
            qb::json names = qb::json::array();
            for (auto const &[name, _] : properties->items()) names.push_back(name);
            constraints["properties"] = std::move(names);
        }

        describe_dependencies(node, constraints);

        if (const auto condition = node.find("if"); condition != node.end()) {
            qb::json bundle = {{"if", *condition}};
            if (const auto then_it = node.find("then"); then_it != node.end()) bundle["then"] = *then_it;
            if (const auto else_it = node.find("else"); else_it != node.end()) bundle["else"] = *else_it;
            constraints["conditional"] = std::move(bundle);
        }
        return record;
    }

    static bool is_empty(const DslRecord &record) {
        return !record.explicit_type && record.constraints.empty() && !record.recursion;
    }

    void visit(const qb::json &node, const std::string &path, bool required, bool is_root) {
        if (_stack.size() > kMaxSchemaDepth) {
            throw SchemaError("Schema nesting is too deep at '" + path + "'.");
        }
        const Resolution res = follow(node);

        if (res.cycle) {
            DslRecord record;
            record.path = path;
            if (required) record.constraints["required"] = true;
            if (loops_to_root(res)) {
                record.type = DslType::Object;
                record.recursion = RecursionTarget::SelfValue;
            } else {
                record.constraints["$ref"] = res.ref;
            }
            _records.push_back(std::move(record));
            return;
        }

        const qb::json &schema = *res.node;
        const std::size_t index = _records.size();
        _records.push_back(describe(schema, path));
        if (required) _records[index].constraints["required"] = true;

        if (!schema.is_object()) {
            if (is_root && is_empty(_records[index])) _records.erase(_records.begin() + index);
            return;
        }

        _stack.push_back(Frame{res.node, path});

        qb::json required_names = qb::json::array();
        if (const auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            required_names = *it;
        }
        auto is_required = [&required_names](const std::string &name) {
            return std::find(required_names.begin(), required_names.end(), name) != required_names.end();
        };

        const auto properties = schema.find("properties");
        if (properties != schema.end() && properties->is_object()) {
            for (auto const &[name, sub_schema] : properties->items()) {
                visit(sub_schema, property_path(path, name), is_required(name), false);
            }
        }
        // required without a matching properties entry still denotes a field
        for (const auto &name : required_names) {
            if (!name.is_string()) continue;
            if (properties != schema.end() && properties->is_object() && properties->contains(name.get<std::string>())) {
                continue;
            }
            DslRecord record;
            record.path = property_path(path, name.get<std::string>());
            record.constraints["required"] = true;
            _records.push_back(std::move(record));
        }

        const auto items = schema.find("items");
        if (items != schema.end() && (items->is_object() || items->is_boolean())) {
            const Resolution item_res = follow(*items);
            if (loops_to_root(item_res)) {
                _records[index].recursion = RecursionTarget::ArrayElement;
            } else {
                visit(*items, path + "[*]", false, false);
            }
        }

        _stack.pop_back();

        if (is_root && is_empty(_records[index])) {
            _records.erase(_records.begin() + index);
        }
    }

public:
    DslConverter(const qb::json &document, std::string root_path)
        : _resolver(document), _root_path(std::move(root_path)) {}

    std::vector<DslRecord> convert(const qb::json &schema) {
        visit(schema, _root_path, false, true);
        return std::move(_records);
    }
};

} // namespace

std::vector<DslRecord> to_dsl(const qb::json &schema, const std::string &parent_path, const qb::json *document) {
    DslConverter converter(document ? *document : schema, parent_path);
    auto records = converter.convert(schema);
    LOG_VALIDATION_DEBUG("JSON Schema flattened into " << records.size() << " DSL records"
                                                       << (parent_path.empty() ? "" : " under '" + parent_path + "'")
                                                       << ".");
    return records;
}

std::string property_path(const std::string &parent, const std::string &name) {
    if (name.empty() || name.find_first_of(".[]") != std::string::npos) {
        throw SchemaError("Property name '" + name + "' cannot be addressed by a field path.");
    }
    return FieldPath::join(parent, name);
}

qb::json to_json(const DslRecord &record) {
    qb::json out = {{"path", record.path},
                    {"type", to_string(record.type)},
                    {"constraints", record.constraints}};
    if (record.nullable) out["nullable"] = true;
    if (!record.multiple_types.empty()) {
        qb::json types = qb::json::array();
        for (const auto type : record.multiple_types) types.push_back(to_string(type));
        out["multipleTypes"] = std::move(types);
    }
    if (record.recursion) {
        out["recursion"] = *record.recursion == RecursionTarget::SelfValue ? "self" : "element";
    }
    return out;
}

} // namespace qb::validation::jsonschema
