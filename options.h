/**
 * @file qbm/validation/options.h
 * @brief Per-call options for `Validator::validate` and `Validator::parse`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <qb/json.h>

namespace qb::validation {

/**
 * @brief Error aggregation switches and the caller supplied context.
 *
 * | abort_early | abort_early_on_each_field | reported errors                     |
 * |-------------|---------------------------|-------------------------------------|
 * | true        | (ignored)                 | the first error of the first field  |
 * | false       | true                      | the first error of every field      |
 * | false       | false                     | every failing predicate             |
 */
class ValidationOptions {
private:
    bool _abort_early = true;
    bool _abort_early_on_each_field = true;
    qb::json _context = nullptr;

public:
    ValidationOptions() = default;

    /// Options suited to full form reporting (one error per failing field).
    static ValidationOptions collect_all() {
        return ValidationOptions().abort_early(false);
    }

    ValidationOptions &abort_early(bool value) {
        _abort_early = value;
        return *this;
    }

    ValidationOptions &abort_early_on_each_field(bool value) {
        _abort_early_on_each_field = value;
        return *this;
    }

    /**
     * @brief Context exposed to context-aware predicates (`from_context`,
     *        `read_only`, `write_only`).
     */
    ValidationOptions &context(qb::json value) {
        _context = std::move(value);
        return *this;
    }

    [[nodiscard]] bool abort_early() const { return _abort_early; }
    [[nodiscard]] bool abort_early_on_each_field() const { return _abort_early_on_each_field; }
    [[nodiscard]] const qb::json &context() const { return _context; }

    /// True when every predicate of a field must run, not only up to its first failure.
    [[nodiscard]] bool collects_every_predicate() const {
        return !_abort_early && !_abort_early_on_each_field;
    }
};

} // namespace qb::validation
