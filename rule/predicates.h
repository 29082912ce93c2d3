/**
 * @file qbm/validation/rule/predicates.h
 * @brief Catalog of rule factories.
 *
 * Every factory returns a ready to use `Rule`. Factories throw
 * `std::invalid_argument` on invalid parameters (NaN bounds, bad regular
 * expressions, empty enumerations), so a bad chain fails when it is built,
 * never while validating.
 *
 * Leaf predicates pass undefined values and values of types they do not
 * apply to: `min_length(3)` accepts `42`. Presence is the business of
 * `required` and the conditional predicates, type is the business of `type`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <qb/json.h>
#include "./format.h"
#include "./rule.h"

namespace qb::validation {

/// Activating condition of a conditional predicate.
using ConditionFn = std::function<bool(const EvalContext &ctx)>;
/// Check on a defined value, with access to the evaluation context.
using ValueCheckFn = std::function<bool(const qb::json &value, const EvalContext &ctx)>;

struct ContextVerdict {
    bool valid = true;
    std::string message;
};

using ContextCheckFn =
    std::function<ContextVerdict(const qb::json *value, const qb::json &context, const qb::json &all_values)>;

struct TupleOptions {
    /// Arrays shorter than the declared positions pass; missing positions are checked as undefined.
    bool allow_shorter = false;
    /// Elements past the declared positions are accepted unchecked.
    bool allow_extra = false;
    /// Chain for every element past the declared positions. Implies `allow_extra`.
    std::vector<Rule> rest;
};

/// Selects the `union_guard` branch a value belongs to.
using GuardFn = std::function<bool(const qb::json &value)>;

struct UnionBranch {
    GuardFn guard;
    std::vector<Rule> chain;

    /// Branch taken by values of type `dt`.
    static UnionBranch for_type(DataType dt, std::vector<Rule> chain) {
        return UnionBranch{[dt](const qb::json &value) { return matches_type(value, dt); }, std::move(chain)};
    }
};

struct FromContextOptions {
    /// Fail when no context was supplied to `validate`.
    bool required = false;
    /// Verdict used when no context was supplied and it is not required.
    bool fallback_to_valid = true;
    std::string error_message;
    std::string code;
};

/// Number of code points of an UTF-8 string.
std::size_t utf8_length(const std::string &value) noexcept;
/// `value` is a multiple of `divisor` up to floating point noise.
bool is_multiple_of(double value, double divisor) noexcept;
/// Compact textual form of a number for messages ("5", "2.5").
std::string format_number(double value);

namespace rules {

// --- presence ---

/// Rejects undefined, null and the empty string.
Rule required(const RuleOptions &options = {});
/// Rejects undefined and the empty string, accepts null.
Rule required_allow_null(const RuleOptions &options = {});
/// Rejects undefined only.
Rule defined(const RuleOptions &options = {});
Rule optional();
Rule nullable();

// --- types ---

Rule type(DataType expected, const RuleOptions &options = {});
/// Accepts a value matching any of `types`. @throws std::invalid_argument if empty.
Rule type_union(std::vector<DataType> types, const RuleOptions &options = {});

// --- strings ---

Rule min_length(std::size_t length, const RuleOptions &options = {});
Rule max_length(std::size_t length, const RuleOptions &options = {});
Rule exact_length(std::size_t length, const RuleOptions &options = {});
Rule pattern(const std::string &regex, const RuleOptions &options = {});
Rule starts_with(std::string prefix, const RuleOptions &options = {});
Rule ends_with(std::string suffix, const RuleOptions &options = {});
Rule alphanumeric(const RuleOptions &options = {});
/**
 * @brief Named format check. `custom` formats take precedence over the
 *        built-in table, unknown names pass.
 */
Rule format(std::string name, const RuleOptions &options = {}, std::shared_ptr<const FormatMap> custom = nullptr);
Rule email(const RuleOptions &options = {});
Rule url(const RuleOptions &options = {});
Rule uuid(const RuleOptions &options = {});
/// Only `base64` is checked, other encodings pass.
Rule content_encoding(std::string encoding, const RuleOptions &options = {});
/// Only `application/json` is checked (the string must parse as JSON).
Rule content_media_type(std::string media_type, const RuleOptions &options = {});

// --- numbers ---

Rule minimum(double bound, bool exclusive = false, const RuleOptions &options = {});
Rule maximum(double bound, bool exclusive = false, const RuleOptions &options = {});
/// Inclusive range. @throws std::invalid_argument if `min > max`.
Rule range(double min, double max, const RuleOptions &options = {});
/// @throws std::invalid_argument unless `divisor` is finite and strictly positive.
Rule multiple_of(double divisor, const RuleOptions &options = {});
Rule integer(const RuleOptions &options = {});
Rule finite(const RuleOptions &options = {});
Rule positive(const RuleOptions &options = {});
Rule negative(const RuleOptions &options = {});

// --- arrays ---

Rule min_items(std::size_t count, const RuleOptions &options = {});
Rule max_items(std::size_t count, const RuleOptions &options = {});
Rule unique_items(const RuleOptions &options = {});
/// At least one element satisfies `element_check`.
Rule contains(std::function<bool(const qb::json &)> element_check, const RuleOptions &options = {});
/// At least one element equals `expected`.
Rule includes(qb::json expected, const RuleOptions &options = {});
/**
 * @brief Fixed positions of an array: element `i` goes through `positions[i]`.
 *
 * The message names the first failing element (`coords[1]: ...`) or the
 * length mismatch. Non-array values pass.
 * @throws std::invalid_argument if a chain holds a recursive or transform entry.
 */
Rule tuple(std::vector<std::vector<Rule>> positions, TupleOptions tuple_options = {}, const RuleOptions &options = {});

// --- values ---

/// Deep equality with one of `allowed`. @throws std::invalid_argument unless a non-empty array.
Rule one_of(qb::json allowed, const RuleOptions &options = {});
Rule literal(qb::json expected, const RuleOptions &options = {});
/**
 * @brief Checks a defined value with the chain of the first branch whose
 *        guard accepts it. Fails when no guard does.
 * @throws std::invalid_argument if `branches` is empty, a guard is missing or
 *         a chain holds a recursive or transform entry.
 */
Rule union_guard(std::vector<UnionBranch> branches, const RuleOptions &options = {});

// --- objects ---

Rule min_properties(std::size_t count, const RuleOptions &options = {});
Rule max_properties(std::size_t count, const RuleOptions &options = {});
/**
 * @brief Rejects keys that are neither listed in `names` nor matched by one
 *        of `patterns`.
 */
Rule allowed_properties(std::vector<std::string> names,
                        std::vector<std::string> patterns = {},
                        const RuleOptions &options = {});

// --- cross field and context ---

/// Equal to the value at `other_path` in the document being validated.
Rule compare_field(std::string other_path, const RuleOptions &options = {});
/// Required (as in `required`) when `condition` holds, otherwise always passes.
Rule required_if(ConditionFn condition, const RuleOptions &options = {});
Rule from_context(ContextCheckFn check, FromContextOptions options = {});
/// Fails when a value is sent on an update (`context.operation == "write"`, `context.isUpdate`).
Rule read_only(const RuleOptions &options = {});
/// Fails when a value is present on a read (`context.operation == "read"`).
Rule write_only(const RuleOptions &options = {});

// --- escape hatches ---

/// Runs `check` on defined values only.
Rule custom(std::string code, ValueCheckFn check, std::string message = {}, const RuleOptions &options = {});
Rule recursively(RecursionTarget target, std::size_t max_depth = kDefaultMaxDepth);
Rule transform(TransformFn fn);

} // namespace rules
} // namespace qb::validation
