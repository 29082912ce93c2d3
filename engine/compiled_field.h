/**
 * @file qbm/validation/engine/compiled_field.h
 * @brief Executable form of one field's rule chain.
 *
 * Compilation hoists the `Optional` and `Nullable` markers, splits the chain
 * into checks, transforms and an optional terminal recursive marker, and
 * rejects malformed chains.
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
#include "../error.h"
#include "../rule/rule.h"

namespace qb::validation {

/**
 * @brief Outcome of evaluating one compiled field at one location.
 */
struct FieldOutcome {
    bool valid = true;
    /// Set when the optional/nullable short-circuit accepted the value without running the chain.
    bool skipped = false;
    std::vector<Error> errors;

    [[nodiscard]] const Error *first_error() const {
        return errors.empty() ? nullptr : &errors.front();
    }
};

class CompiledField {
private:
    bool _optional = false;
    bool _nullable = false;
    std::vector<Rule> _checks;
    std::vector<Rule> _transforms;
    std::optional<Rule> _recursion;

public:
    /**
     * @throws RuleChainError if more than one `Recursive` entry is present or
     *         if it is not the last entry of the chain.
     */
    explicit CompiledField(const std::vector<Rule> &chain, const std::string &path_for_errors = {});

    /**
     * @brief Runs the chain against `value` (nullptr = undefined).
     * @param stop_at_first_error Stop after the first failing predicate.
     */
    [[nodiscard]] FieldOutcome evaluate(const qb::json *value,
                                        const std::string &path,
                                        const EvalContext &ctx,
                                        bool stop_at_first_error = true) const;

    /**
     * @brief Applies the transforms left to right.
     * @return the transformed value, or std::nullopt with `error` set when a transform threw.
     */
    [[nodiscard]] std::optional<qb::json> apply_transforms(const qb::json &value, std::string &error) const;

    [[nodiscard]] bool is_optional() const { return _optional; }
    [[nodiscard]] bool is_nullable() const { return _nullable; }
    [[nodiscard]] bool has_transforms() const { return !_transforms.empty(); }
    [[nodiscard]] const std::optional<Rule> &recursion() const { return _recursion; }
    [[nodiscard]] std::size_t check_count() const { return _checks.size(); }
};

} // namespace qb::validation
