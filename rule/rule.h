/**
 * @file qbm/validation/rule/rule.h
 * @brief Chain entries attached to a field path.
 *
 * A `Rule` is one entry of a rule chain. Its `RuleKind` tells the chain
 * compiler how to treat it:
 *  - `Base`: a pure check on the value, skipped when the value is undefined
 *    by the predicates themselves;
 *  - `Optional` / `Nullable`: hoisted markers that short-circuit the chain on
 *    undefined / null values;
 *  - `Conditional`: a check that may look at the whole document and the array
 *    context; it must pass whenever its activating condition is false;
 *  - `Recursive`: re-applies the whole field set to the value or to each of
 *    its elements; must be the last entry of its chain;
 *  - `Transform`: value rewrite applied by `Validator::parse` on success.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <qb/json.h>
#include "../config.h"
#include "../types.h"

namespace qb::validation {

enum class RuleKind {
    Base,
    Optional,
    Nullable,
    Conditional,
    Recursive,
    Transform
};

enum class RecursionTarget {
    SelfValue,
    ArrayElement
};

/**
 * @brief What a message factory gets to build an error message.
 */
struct MessageContext {
    const qb::json *value;
    const std::string &path;
    const EvalContext &eval;
};

using CheckFn = std::function<bool(const qb::json *value, const EvalContext &ctx)>;
using MessageFn = std::function<std::string(const MessageContext &ctx)>;
using TransformFn = std::function<qb::json(const qb::json &value)>;

/**
 * @brief Overrides accepted by every predicate factory.
 */
struct RuleOptions {
    std::string code;
    MessageFn message_factory;

    RuleOptions() = default;
    RuleOptions(std::string c) : code(std::move(c)) {}
    RuleOptions(const char *c) : code(c) {}
    RuleOptions(std::string c, MessageFn factory)
        : code(std::move(c)), message_factory(std::move(factory)) {}

    /// Options carrying a fixed message and the predicate's own code.
    static RuleOptions with_message(std::string message) {
        RuleOptions opts;
        opts.message_factory = [msg = std::move(message)](const MessageContext &) { return msg; };
        return opts;
    }
};

class Rule {
private:
    RuleKind _kind = RuleKind::Base;
    std::string _code;
    CheckFn _check;
    MessageFn _message;
    TransformFn _transform;
    RecursionTarget _target = RecursionTarget::SelfValue;
    std::size_t _max_depth = kDefaultMaxDepth;

    Rule(RuleKind kind, std::string code);

public:
    /**
     * @brief A value check. `options.code` and `options.message_factory`
     *        replace `code` and `message` when set.
     * @throws std::invalid_argument if `check` is empty.
     */
    static Rule base(std::string code, CheckFn check, MessageFn message, const RuleOptions &options = {});
    static Rule conditional(std::string code, CheckFn check, MessageFn message, const RuleOptions &options = {});
    static Rule optional();
    static Rule nullable();
    static Rule recursive(RecursionTarget target, std::size_t max_depth = kDefaultMaxDepth);
    /// @throws std::invalid_argument if `fn` is empty.
    static Rule transform(TransformFn fn);

    [[nodiscard]] RuleKind kind() const { return _kind; }
    [[nodiscard]] const std::string &code() const { return _code; }
    [[nodiscard]] RecursionTarget target() const { return _target; }
    [[nodiscard]] std::size_t max_depth() const { return _max_depth; }
    [[nodiscard]] bool is_check() const {
        return _kind == RuleKind::Base || _kind == RuleKind::Conditional;
    }

    /**
     * @brief Runs the check. Markers and transforms always pass. A check that
     *        throws is reported as a failure.
     */
    [[nodiscard]] bool check(const qb::json *value, const EvalContext &ctx) const;
    [[nodiscard]] std::string message(const qb::json *value, const std::string &path, const EvalContext &ctx) const;

    /// Applies a Transform entry; other kinds return the value unchanged.
    [[nodiscard]] qb::json apply(const qb::json &value) const;
};

std::string to_string(RuleKind kind);

} // namespace qb::validation
