/**
 * @file qbm/validation/engine/compiled_field.cpp
 * @brief Implementation of the rule chain compiler.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./compiled_field.h"
#include "../logger.h"

namespace qb::validation {

CompiledField::CompiledField(const std::vector<Rule> &chain, const std::string &path_for_errors) {
    for (std::size_t i = 0; i < chain.size(); ++i) {
        const Rule &rule = chain[i];
        switch (rule.kind()) {
            case RuleKind::Optional:
                _optional = true;
                break;
            case RuleKind::Nullable:
                _nullable = true;
                break;
            case RuleKind::Base:
            case RuleKind::Conditional:
                _checks.push_back(rule);
                break;
            case RuleKind::Transform:
                _transforms.push_back(rule);
                break;
            case RuleKind::Recursive:
                if (_recursion) {
                    throw RuleChainError("Field '" + path_for_errors +
                                         "' declares more than one recursive rule.");
                }
                if (i + 1 != chain.size()) {
                    throw RuleChainError("Recursive rule of field '" + path_for_errors +
                                         "' must be the last rule of its chain.");
                }
                _recursion = rule;
                break;
        }
    }
}

FieldOutcome CompiledField::evaluate(const qb::json *value,
                                     const std::string &path,
                                     const EvalContext &ctx,
                                     bool stop_at_first_error) const {
    FieldOutcome outcome;

    if (!value && _optional) {
        outcome.skipped = true;
        return outcome;
    }
    if (value && value->is_null()) {
        if (_nullable) {
            outcome.skipped = true;
            return outcome;
        }
        if (_optional) {
            const Rule marker = Rule::optional();
            outcome.valid = false;
            outcome.errors.emplace_back(path, marker.code(), marker.message(value, path, ctx), *value);
            if (stop_at_first_error) return outcome;
        }
    }

    for (const auto &rule : _checks) {
        if (rule.check(value, ctx)) continue;
        outcome.valid = false;
        std::string code = rule.code().empty() ? std::string(codes::FALLBACK) : rule.code();
        std::optional<qb::json> offending;
        if (value) offending = *value;
        outcome.errors.emplace_back(path, std::move(code), rule.message(value, path, ctx), std::move(offending));
        if (stop_at_first_error) break;
    }
    return outcome;
}

std::optional<qb::json> CompiledField::apply_transforms(const qb::json &value, std::string &error) const {
    qb::json current = value;
    for (const auto &rule : _transforms) {
        try {
            current = rule.apply(current);
        } catch (const std::exception &e) {
            LOG_VALIDATION_DEBUG("Transform failed: " << e.what());
            error = std::string("Transform failed: ") + e.what();
            return std::nullopt;
        }
    }
    return current;
}

} // namespace qb::validation
