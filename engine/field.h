/**
 * @file qbm/validation/engine/field.h
 * @brief Field definitions and the fluent builder that produces them.
 *
 * A `FieldDefinition` binds a field path to an ordered rule chain and an
 * optional default value. `FieldBuilder` appends rules in call order:
 *
 * @code
 * auto name = FieldBuilder("user.name").required().string().min_length(3).build();
 * auto tags = FieldBuilder("tags[*]").string().transform(transforms::trim()).build();
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <qb/json.h>
#include "../path/field_path.h"
#include "../rule/predicates.h"
#include "../rule/rule.h"

namespace qb::validation {

using DefaultGenerator = std::function<qb::json()>;

struct DefaultOptions {
    /// Also substitute the default when the value is `null`.
    bool apply_to_null = false;
};

class FieldDefinition {
private:
    FieldPath _path;
    std::vector<Rule> _rules;
    std::variant<std::monostate, qb::json, DefaultGenerator> _default;
    DefaultOptions _default_options;

public:
    explicit FieldDefinition(const std::string &path, std::vector<Rule> rules = {});

    [[nodiscard]] const FieldPath &path() const { return _path; }
    [[nodiscard]] const std::vector<Rule> &rules() const { return _rules; }
    [[nodiscard]] bool has_default() const { return !std::holds_alternative<std::monostate>(_default); }
    [[nodiscard]] const DefaultOptions &default_options() const { return _default_options; }

    /**
     * @brief Produces the default value, invoking the generator if one was set.
     * @throws std::logic_error if the definition has no default.
     */
    [[nodiscard]] qb::json materialize_default() const;

    /**
     * @brief True when `value` (nullptr = undefined) must be replaced by the default.
     */
    [[nodiscard]] bool needs_default(const qb::json *value) const;

    FieldDefinition &add_rule(Rule rule);
    FieldDefinition &set_default(qb::json value, DefaultOptions options = {});
    FieldDefinition &set_default(DefaultGenerator generator, DefaultOptions options = {});
};

/**
 * @brief Fluent construction of a `FieldDefinition`.
 */
class FieldBuilder {
private:
    FieldDefinition _definition;

public:
    explicit FieldBuilder(const std::string &path)
        : _definition(path) {}

    FieldBuilder &rule(Rule r) {
        _definition.add_rule(std::move(r));
        return *this;
    }

    FieldBuilder &required(const RuleOptions &options = {}) { return rule(rules::required(options)); }
    FieldBuilder &optional() { return rule(rules::optional()); }
    FieldBuilder &nullable() { return rule(rules::nullable()); }

    FieldBuilder &type(DataType dt, const RuleOptions &options = {}) { return rule(rules::type(dt, options)); }
    FieldBuilder &string(const RuleOptions &options = {}) { return type(DataType::STRING, options); }
    FieldBuilder &number(const RuleOptions &options = {}) { return type(DataType::NUMBER, options); }
    FieldBuilder &boolean(const RuleOptions &options = {}) { return type(DataType::BOOLEAN, options); }
    FieldBuilder &array(const RuleOptions &options = {}) { return type(DataType::ARRAY, options); }
    FieldBuilder &object(const RuleOptions &options = {}) { return type(DataType::OBJECT, options); }
    FieldBuilder &integer(const RuleOptions &options = {}) {
        type(DataType::NUMBER, options);
        return rule(rules::integer(options));
    }

    FieldBuilder &min_length(std::size_t n, const RuleOptions &options = {}) { return rule(rules::min_length(n, options)); }
    FieldBuilder &max_length(std::size_t n, const RuleOptions &options = {}) { return rule(rules::max_length(n, options)); }
    FieldBuilder &exact_length(std::size_t n, const RuleOptions &options = {}) { return rule(rules::exact_length(n, options)); }
    FieldBuilder &pattern(const std::string &re, const RuleOptions &options = {}) { return rule(rules::pattern(re, options)); }
    FieldBuilder &format(std::string name, const RuleOptions &options = {}) { return rule(rules::format(std::move(name), options)); }
    FieldBuilder &email(const RuleOptions &options = {}) { return rule(rules::email(options)); }
    FieldBuilder &url(const RuleOptions &options = {}) { return rule(rules::url(options)); }
    FieldBuilder &uuid(const RuleOptions &options = {}) { return rule(rules::uuid(options)); }

    FieldBuilder &minimum(double bound, bool exclusive = false, const RuleOptions &options = {}) {
        return rule(rules::minimum(bound, exclusive, options));
    }
    FieldBuilder &maximum(double bound, bool exclusive = false, const RuleOptions &options = {}) {
        return rule(rules::maximum(bound, exclusive, options));
    }
    FieldBuilder &range(double min, double max, const RuleOptions &options = {}) { return rule(rules::range(min, max, options)); }
    FieldBuilder &multiple_of(double d, const RuleOptions &options = {}) { return rule(rules::multiple_of(d, options)); }

    FieldBuilder &min_items(std::size_t n, const RuleOptions &options = {}) { return rule(rules::min_items(n, options)); }
    FieldBuilder &max_items(std::size_t n, const RuleOptions &options = {}) { return rule(rules::max_items(n, options)); }
    FieldBuilder &unique_items(const RuleOptions &options = {}) { return rule(rules::unique_items(options)); }
    /// Array type check followed by the positional chains.
    FieldBuilder &tuple(std::vector<std::vector<Rule>> positions, TupleOptions tuple_options = {},
                        const RuleOptions &options = {}) {
        array();
        return rule(rules::tuple(std::move(positions), std::move(tuple_options), options));
    }

    FieldBuilder &one_of(qb::json allowed, const RuleOptions &options = {}) { return rule(rules::one_of(std::move(allowed), options)); }
    FieldBuilder &literal(qb::json expected, const RuleOptions &options = {}) { return rule(rules::literal(std::move(expected), options)); }
    FieldBuilder &union_guard(std::vector<UnionBranch> branches, const RuleOptions &options = {}) {
        return rule(rules::union_guard(std::move(branches), options));
    }

    FieldBuilder &required_if(ConditionFn condition, const RuleOptions &options = {}) {
        return rule(rules::required_if(std::move(condition), options));
    }
    FieldBuilder &compare_field(std::string other, const RuleOptions &options = {}) {
        return rule(rules::compare_field(std::move(other), options));
    }
    FieldBuilder &custom(std::string code, ValueCheckFn check, std::string message = {}) {
        return rule(rules::custom(std::move(code), std::move(check), std::move(message)));
    }
    FieldBuilder &recursively(RecursionTarget target, std::size_t max_depth = kDefaultMaxDepth) {
        return rule(rules::recursively(target, max_depth));
    }
    FieldBuilder &transform(TransformFn fn) { return rule(rules::transform(std::move(fn))); }

    FieldBuilder &default_value(qb::json value, DefaultOptions options = {}) {
        _definition.set_default(std::move(value), options);
        return *this;
    }
    FieldBuilder &default_value(DefaultGenerator generator, DefaultOptions options = {}) {
        _definition.set_default(std::move(generator), options);
        return *this;
    }

    [[nodiscard]] FieldDefinition build() const { return _definition; }
};

} // namespace qb::validation
