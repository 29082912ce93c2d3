/**
 * @file qbm/validation/jsonschema/dsl.h
 * @brief Flattened, path keyed form of a JSON Schema.
 *
 * `to_dsl` walks a schema graph and emits one `DslRecord` per addressable
 * location: the node itself (when it constrains anything), one record per
 * property at `parent.property`, and one record per single `items` schema at
 * `parent[*]`. Everything that cannot be addressed by a path (composition
 * branches, conditionals, tuple positions, pattern properties...) stays in the
 * record's constraints as raw sub-schemas.
 *
 * Constraint keys are the JSON Schema keywords, normalized:
 *  - `minimum` / `maximum` are inclusive bounds, `exclusiveMinimum` /
 *    `exclusiveMaximum` are numeric exclusive bounds (the legacy boolean form
 *    is converted);
 *  - `integer: true` marks an integer type, `types` keeps a type union;
 *  - `required: true` when the parent lists the property as required;
 *  - `properties` is the list of declared property names;
 *  - `dependencies` is split into `dependentRequired` / `dependentSchemas`;
 *  - `conditional` bundles `if` / `then` / `else`;
 *  - `$ref` is a reference that loops back on a node already being expanded,
 *    checked lazily at validation time.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <qb/json.h>
#include "../rule/rule.h"

namespace qb::validation::jsonschema {

enum class DslType {
    String,
    Number,
    Boolean,
    Array,
    Object,
    Null,
    Tuple,
    Any
};

std::string to_string(DslType type);

struct DslRecord {
    std::string path;
    DslType type = DslType::Any;
    /// The type comes from a `type` keyword (and is enforced), not inferred.
    bool explicit_type = false;
    bool nullable = false;
    std::vector<DslType> multiple_types;
    qb::json constraints = qb::json::object();
    /// Set when the node refers back to the root schema.
    std::optional<RecursionTarget> recursion;

    [[nodiscard]] bool has(const char *keyword) const { return constraints.contains(keyword); }
};

/**
 * @brief Flattens `schema` into records rooted at `parent_path`.
 * @param document document `$ref` pointers are resolved against; `schema` itself when null.
 * @throws ExternalRefError, UnresolvedRefError
 * @throws SchemaError on malformed schemas and property names `property_path` rejects
 */
std::vector<DslRecord> to_dsl(const qb::json &schema,
                              const std::string &parent_path = "",
                              const qb::json *document = nullptr);

/**
 * @brief Field path of property `name` below `parent`.
 * @throws SchemaError if `name` is empty or holds path syntax (`.`, `[`, `]`):
 *         such properties cannot be addressed by a field path.
 */
std::string property_path(const std::string &parent, const std::string &name);

/// Inspection form of a record.
qb::json to_json(const DslRecord &record);

} // namespace qb::validation::jsonschema
