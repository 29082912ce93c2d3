/**
 * @file qbm/validation/engine/validator.h
 * @brief The validation plan: compiled fields executed against a document.
 *
 * A `Validator` is built once from a list of `FieldDefinition`s and is
 * immutable afterwards. `validate` and `parse` keep their state on the stack,
 * so a single instance may be used from several threads at once as long as
 * the predicates it holds are side-effect free.
 *
 * @code
 * auto validator = ValidatorBuilder()
 *     .field("name", [](FieldBuilder &f) { f.required().string().min_length(3); })
 *     .field("items[*].price", [](FieldBuilder &f) { f.number().minimum(0); })
 *     .build();
 * Result result = validator.validate(document, ValidationOptions::collect_all());
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <qb/json.h>
#include "../error.h"
#include "../options.h"
#include "./compiled_field.h"
#include "./field.h"

namespace qb::validation {

/**
 * @brief Result of `Validator::parse`; `data` is set only when validation succeeded.
 */
struct ParseResult {
    Result result;
    std::optional<qb::json> data;

    [[nodiscard]] bool success() const { return result.success(); }
};

class Validator {
private:
    struct Field {
        FieldDefinition definition;
        CompiledField compiled;
    };

    struct RunState {
        const ValidationOptions &options;
        Result &result;
        qb::json *output; // null when validating only
    };

    std::vector<Field> _fields;

    bool run(const qb::json &root,
             const std::vector<PathSegment> &prefix,
             std::size_t depth,
             RunState &state) const;

    bool evaluate_location(const Field &field,
                           const ResolvedLocation &location,
                           const qb::json &root,
                           const std::vector<PathSegment> &prefix,
                           std::size_t depth,
                           RunState &state) const;

    bool recurse(const Rule &recursion,
                 const qb::json &value,
                 std::vector<PathSegment> segments,
                 std::size_t depth,
                 RunState &state) const;

public:
    /**
     * @throws RuleChainError if a field's chain is malformed.
     */
    explicit Validator(std::vector<FieldDefinition> fields);

    [[nodiscard]] Result validate(const qb::json &data, const ValidationOptions &options = {}) const;

    /**
     * @brief Validates `data` and, on success, returns a copy with defaults
     *        materialized and transforms applied. Nothing is returned on failure.
     */
    [[nodiscard]] ParseResult parse(const qb::json &data, const ValidationOptions &options = {}) const;

    [[nodiscard]] std::size_t size() const { return _fields.size(); }
    [[nodiscard]] std::vector<FieldDefinition> definitions() const;
};

/**
 * @brief Collects field definitions in declaration order, then builds the `Validator`.
 */
class ValidatorBuilder {
private:
    std::vector<FieldDefinition> _fields;

public:
    ValidatorBuilder &field(const std::string &path, const std::function<void(FieldBuilder &)> &configure);
    ValidatorBuilder &add(FieldDefinition definition);
    ValidatorBuilder &add(std::vector<FieldDefinition> definitions);

    [[nodiscard]] Validator build() const;
};

} // namespace qb::validation
