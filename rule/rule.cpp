#include "./rule.h"
#include <stdexcept>
#include "../logger.h"

namespace qb::validation {

Rule::Rule(RuleKind kind, std::string code)
    : _kind(kind), _code(std::move(code)) {}

static MessageFn fixed_message(std::string text) {
    return [text = std::move(text)](const MessageContext &) { return text; };
}

Rule Rule::base(std::string code, CheckFn check, MessageFn message, const RuleOptions &options) {
    if (!check) {
        throw std::invalid_argument("Rule '" + code + "' requires a check function.");
    }
    Rule rule(RuleKind::Base, options.code.empty() ? std::move(code) : options.code);
    rule._check = std::move(check);
    rule._message = options.message_factory ? options.message_factory : std::move(message);
    return rule;
}

Rule Rule::conditional(std::string code, CheckFn check, MessageFn message, const RuleOptions &options) {
    Rule rule = base(std::move(code), std::move(check), std::move(message), options);
    rule._kind = RuleKind::Conditional;
    return rule;
}

Rule Rule::optional() {
    Rule rule(RuleKind::Optional, codes::OPTIONAL);
    rule._message = fixed_message("Field cannot be null (use undefined for optional fields).");
    return rule;
}

Rule Rule::nullable() {
    return Rule(RuleKind::Nullable, "nullable");
}

Rule Rule::recursive(RecursionTarget target, std::size_t max_depth) {
    Rule rule(RuleKind::Recursive, codes::RECURSIVE);
    rule._target = target;
    rule._max_depth = max_depth;
    return rule;
}

Rule Rule::transform(TransformFn fn) {
    if (!fn) {
        throw std::invalid_argument("Transform rule requires a function.");
    }
    Rule rule(RuleKind::Transform, codes::TRANSFORM);
    rule._transform = std::move(fn);
    return rule;
}

bool Rule::check(const qb::json *value, const EvalContext &ctx) const {
    if (!_check) return true;
    try {
        return _check(value, ctx);
    } catch (const std::exception &e) {
        LOG_VALIDATION_DEBUG("Rule '" << _code << "' threw during check: " << e.what());
        return false;
    }
}

std::string Rule::message(const qb::json *value, const std::string &path, const EvalContext &ctx) const {
    if (!_message) return "Validation failed for rule '" + _code + "'.";
    try {
        return _message(MessageContext{value, path, ctx});
    } catch (const std::exception &e) {
        LOG_VALIDATION_DEBUG("Message factory of rule '" << _code << "' threw: " << e.what());
        return "Validation failed for rule '" + _code + "'.";
    }
}

qb::json Rule::apply(const qb::json &value) const {
    if (_kind != RuleKind::Transform) return value;
    return _transform(value);
}

std::string to_string(RuleKind kind) {
    switch (kind) {
        case RuleKind::Base: return "base";
        case RuleKind::Optional: return "optional";
        case RuleKind::Nullable: return "nullable";
        case RuleKind::Conditional: return "conditional";
        case RuleKind::Recursive: return "recursive";
        case RuleKind::Transform: return "transform";
    }
    return "unknown";
}

} // namespace qb::validation
