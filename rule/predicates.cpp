/**
 * @file qbm/validation/rule/predicates.cpp
 * @brief Implementation of the rule factories.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./predicates.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>
#include <regex>
#include <stdexcept>
#include <qb/system/container/unordered_set.h>
#include "../path/field_path.h"

namespace qb::validation {

std::size_t utf8_length(const std::string &value) noexcept {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool is_multiple_of(double value, double divisor) noexcept {
    if (divisor <= 0 || !std::isfinite(value)) return false;
    const double quotient = value / divisor;
    const double nearest = std::round(quotient);
    return std::fabs(quotient - nearest) <= 1e-9 * std::max(1.0, std::fabs(quotient));
}

std::string format_number(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    return qb::json(value).dump();
}

namespace rules {
namespace {

MessageFn fixed(std::string text) {
    return [text = std::move(text)](const MessageContext &) { return text; };
}

void require_finite(double bound, const char *what) {
    if (!std::isfinite(bound)) {
        throw std::invalid_argument(std::string(what) + " bound must be a finite number.");
    }
}

bool is_blank_string(const qb::json &value) {
    return value.is_string() && value.get_ref<const std::string &>().empty();
}

void require_check_chain(const std::vector<Rule> &chain, const char *owner) {
    for (const auto &rule : chain) {
        if (rule.kind() == RuleKind::Recursive || rule.kind() == RuleKind::Transform) {
            throw std::invalid_argument(std::string(owner) + " chains accept checks only, got a " +
                                        to_string(rule.kind()) + " entry.");
        }
    }
}

// First entry of `chain` rejecting `value`, nullptr when the chain accepts it.
const Rule *first_failure(const std::vector<Rule> &chain, const qb::json *value, const EvalContext &ctx) {
    const Rule *optional = nullptr;
    bool nullable = false;
    for (const auto &rule : chain) {
        if (rule.kind() == RuleKind::Optional) optional = &rule;
        if (rule.kind() == RuleKind::Nullable) nullable = true;
    }
    if (!value && optional) return nullptr;
    if (value && value->is_null()) {
        if (nullable) return nullptr;
        if (optional) return optional;
    }
    for (const auto &rule : chain) {
        if (rule.is_check() && !rule.check(value, ctx)) return &rule;
    }
    return nullptr;
}

struct TupleShape {
    std::vector<std::vector<Rule>> positions;
    TupleOptions options;
};

// Verdict on an array; `message` receives the reason when it is set.
bool inspect_tuple(const TupleShape &shape, const qb::json &array, const EvalContext &ctx, const std::string &path,
                   std::string *message) {
    const std::size_t declared = shape.positions.size();
    const std::size_t size = array.size();
    const bool extra = shape.options.allow_extra || !shape.options.rest.empty();
    if ((size < declared && !shape.options.allow_shorter) || (size > declared && !extra)) {
        if (message) {
            const char *bound = "exactly";
            if (size < declared && extra) bound = "at least";
            if (size > declared && shape.options.allow_shorter) bound = "at most";
            *message = std::string("Tuple must have ") + bound + " " + std::to_string(declared) + " elements, got " +
                       std::to_string(size) + ".";
        }
        return false;
    }
    for (std::size_t i = 0; i < std::max(size, declared); ++i) {
        const std::vector<Rule> &chain = i < declared ? shape.positions[i] : shape.options.rest;
        const qb::json *element = i < size ? &array[i] : nullptr;
        const ArrayContext item{i, element, &array};
        const EvalContext element_ctx(ctx.all_values, ctx.context, &item, &array);
        const Rule *failed = first_failure(chain, element, element_ctx);
        if (!failed) continue;
        if (message) {
            const std::string element_path = path + "[" + std::to_string(i) + "]";
            *message = element_path + ": " + failed->message(element, element_path, element_ctx);
        }
        return false;
    }
    return true;
}


} // namespace

// --- presence ---

Rule required(const RuleOptions &options) {
    return Rule::base(codes::REQUIRED,
                      [](const qb::json *value, const EvalContext &) {
                          return value && !value->is_null() && !is_blank_string(*value);
                      },
                      fixed("Field is required."), options);
}

Rule required_allow_null(const RuleOptions &options) {
    return Rule::base(codes::REQUIRED,
                      [](const qb::json *value, const EvalContext &) {
                          return value && !is_blank_string(*value);
                      },
                      fixed("Field is required."), options);
}

Rule defined(const RuleOptions &options) {
    return Rule::base(codes::REQUIRED,
                      [](const qb::json *value, const EvalContext &) { return value != nullptr; },
                      fixed("Field is required."), options);
}

Rule optional() {
    return Rule::optional();
}

Rule nullable() {
    return Rule::nullable();
}

// --- types ---

Rule type(DataType expected, const RuleOptions &options) {
    return Rule::base(codes::TYPE,
                      [expected](const qb::json *value, const EvalContext &) {
                          return !value || matches_type(*value, expected);
                      },
                      fixed("Invalid type. Expected " + data_type_to_string(expected) + "."), options);
}

Rule type_union(std::vector<DataType> types, const RuleOptions &options) {
    if (types.empty()) {
        throw std::invalid_argument("type_union requires at least one type.");
    }
    std::string names;
    for (const auto dt : types) {
        if (!names.empty()) names += ", ";
        names += data_type_to_string(dt);
    }
    return Rule::base(codes::TYPE,
                      [types = std::move(types)](const qb::json *value, const EvalContext &) {
                          if (!value) return true;
                          return std::any_of(types.begin(), types.end(),
                                             [value](DataType dt) { return matches_type(*value, dt); });
                      },
                      fixed("Invalid type. Expected one of: " + names + "."), options);
}

// --- strings ---

Rule min_length(std::size_t length, const RuleOptions &options) {
    return Rule::base(codes::MIN_LENGTH,
                      [length](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_string() ||
                                 utf8_length(value->get_ref<const std::string &>()) >= length;
                      },
                      fixed("String too short. Minimum length is " + std::to_string(length) + "."), options);
}

Rule max_length(std::size_t length, const RuleOptions &options) {
    return Rule::base(codes::MAX_LENGTH,
                      [length](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_string() ||
                                 utf8_length(value->get_ref<const std::string &>()) <= length;
                      },
                      fixed("String too long. Maximum length is " + std::to_string(length) + "."), options);
}

Rule exact_length(std::size_t length, const RuleOptions &options) {
    return Rule::base(codes::LENGTH,
                      [length](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_string() ||
                                 utf8_length(value->get_ref<const std::string &>()) == length;
                      },
                      fixed("String must be exactly " + std::to_string(length) + " characters long."), options);
}

Rule pattern(const std::string &regex, const RuleOptions &options) {
    std::shared_ptr<const std::regex> compiled;
    try {
        compiled = std::make_shared<const std::regex>(
            regex, std::regex_constants::ECMAScript | std::regex_constants::optimize);
    } catch (const std::regex_error &e) {
        throw std::invalid_argument("Invalid regex pattern: '" + regex + "'. Error: " + e.what());
    }
    return Rule::base(codes::PATTERN,
                      [compiled](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_string() ||
                                 std::regex_search(value->get_ref<const std::string &>(), *compiled);
                      },
                      fixed("String does not match pattern: " + regex), options);
}

Rule starts_with(std::string prefix, const RuleOptions &options) {
    std::string message = "String must start with '" + prefix + "'.";
    return Rule::base(codes::STARTS_WITH,
                      [prefix = std::move(prefix)](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_string() ||
                                 value->get_ref<const std::string &>().rfind(prefix, 0) == 0;
                      },
                      fixed(std::move(message)), options);
}

Rule ends_with(std::string suffix, const RuleOptions &options) {
    std::string message = "String must end with '" + suffix + "'.";
    return Rule::base(codes::ENDS_WITH,
                      [suffix = std::move(suffix)](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_string()) return true;
                          const auto &s = value->get_ref<const std::string &>();
                          return s.size() >= suffix.size() &&
                                 s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
                      },
                      fixed(std::move(message)), options);
}

Rule alphanumeric(const RuleOptions &options) {
    return Rule::base(codes::ALPHANUMERIC,
                      [](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_string()) return true;
                          const auto &s = value->get_ref<const std::string &>();
                          return std::all_of(s.begin(), s.end(),
                                             [](unsigned char c) { return std::isalnum(c) != 0; });
                      },
                      fixed("String must contain only letters and digits."), options);
}

Rule format(std::string name, const RuleOptions &options, std::shared_ptr<const FormatMap> custom) {
    if (name.empty()) {
        throw std::invalid_argument("format requires a format name.");
    }
    std::string message = "String does not match format '" + name + "'.";
    return Rule::base(codes::FORMAT,
                      [name = std::move(name), custom = std::move(custom)](const qb::json *value,
                                                                          const EvalContext &) {
                          return !value || !value->is_string() ||
                                 formats::check(name, value->get_ref<const std::string &>(), custom.get());
                      },
                      fixed(std::move(message)), options);
}

Rule email(const RuleOptions &options) {
    return format("email", options);
}

Rule url(const RuleOptions &options) {
    return format("url", options);
}

Rule uuid(const RuleOptions &options) {
    return format("uuid", options);
}

Rule content_encoding(std::string encoding, const RuleOptions &options) {
    std::string message = "String is not valid " + encoding + " content.";
    return Rule::base(codes::CONTENT_ENCODING,
                      [encoding = std::move(encoding)](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_string() || encoding != "base64") return true;
                          return formats::is_base64(value->get_ref<const std::string &>());
                      },
                      fixed(std::move(message)), options);
}

Rule content_media_type(std::string media_type, const RuleOptions &options) {
    std::string message = "String is not valid " + media_type + " content.";
    return Rule::base(codes::CONTENT_MEDIA_TYPE,
                      [media_type = std::move(media_type)](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_string() || media_type != "application/json") return true;
                          return qb::json::accept(value->get_ref<const std::string &>());
                      },
                      fixed(std::move(message)), options);
}

// --- numbers ---

Rule minimum(double bound, bool exclusive, const RuleOptions &options) {
    require_finite(bound, "minimum");
    std::string message = exclusive ? "Value must be greater than " + format_number(bound) + "."
                                    : "Value must be greater than or equal to " + format_number(bound) + ".";
    return Rule::base(codes::MINIMUM,
                      [bound, exclusive](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_number()) return true;
                          const double v = value->get<double>();
                          return exclusive ? v > bound : v >= bound;
                      },
                      fixed(std::move(message)), options);
}

Rule maximum(double bound, bool exclusive, const RuleOptions &options) {
    require_finite(bound, "maximum");
    std::string message = exclusive ? "Value must be less than " + format_number(bound) + "."
                                    : "Value must be less than or equal to " + format_number(bound) + ".";
    return Rule::base(codes::MAXIMUM,
                      [bound, exclusive](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_number()) return true;
                          const double v = value->get<double>();
                          return exclusive ? v < bound : v <= bound;
                      },
                      fixed(std::move(message)), options);
}

Rule range(double min, double max, const RuleOptions &options) {
    require_finite(min, "range");
    require_finite(max, "range");
    if (min > max) {
        throw std::invalid_argument("range lower bound " + format_number(min) + " is above upper bound " +
                                    format_number(max) + ".");
    }
    return Rule::base("range",
                      [min, max](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_number()) return true;
                          const double v = value->get<double>();
                          return v >= min && v <= max;
                      },
                      fixed("Value must be between " + format_number(min) + " and " + format_number(max) + "."),
                      options);
}

Rule multiple_of(double divisor, const RuleOptions &options) {
    if (!std::isfinite(divisor) || divisor <= 0) {
        throw std::invalid_argument("multiple_of divisor must be a finite number greater than 0.");
    }
    return Rule::base(codes::MULTIPLE_OF,
                      [divisor](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_number() || is_multiple_of(value->get<double>(), divisor);
                      },
                      fixed("Value must be a multiple of " + format_number(divisor) + "."), options);
}

Rule integer(const RuleOptions &options) {
    return Rule::base(codes::INTEGER,
                      [](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_number() || is_integral(*value);
                      },
                      fixed("Value must be an integer."), options);
}

Rule finite(const RuleOptions &options) {
    return Rule::base(codes::FINITE,
                      [](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_number() || std::isfinite(value->get<double>());
                      },
                      fixed("Value must be a finite number."), options);
}

Rule positive(const RuleOptions &options) {
    return Rule::base("positive",
                      [](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_number() || value->get<double>() > 0;
                      },
                      fixed("Value must be positive."), options);
}

Rule negative(const RuleOptions &options) {
    return Rule::base("negative",
                      [](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_number() || value->get<double>() < 0;
                      },
                      fixed("Value must be negative."), options);
}

// --- arrays ---

Rule min_items(std::size_t count, const RuleOptions &options) {
    return Rule::base(codes::MIN_ITEMS,
                      [count](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_array() || value->size() >= count;
                      },
                      fixed("Array must contain at least " + std::to_string(count) + " items."), options);
}

Rule max_items(std::size_t count, const RuleOptions &options) {
    return Rule::base(codes::MAX_ITEMS,
                      [count](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_array() || value->size() <= count;
                      },
                      fixed("Array must contain at most " + std::to_string(count) + " items."), options);
}

Rule unique_items(const RuleOptions &options) {
    return Rule::base(codes::UNIQUE_ITEMS,
                      [](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_array()) return true;
                          qb::unordered_set<qb::json> seen_items;
                          for (const auto &item : *value) {
                              if (!seen_items.insert(item).second) return false;
                          }
                          return true;
                      },
                      fixed("Array items must be unique."), options);
}

Rule contains(std::function<bool(const qb::json &)> element_check, const RuleOptions &options) {
    if (!element_check) {
        throw std::invalid_argument("contains requires an element check.");
    }
    return Rule::base(codes::CONTAINS,
                      [element_check = std::move(element_check)](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_array()) return true;
                          return std::any_of(value->begin(), value->end(), element_check);
                      },
                      fixed("Array must contain at least one matching item."), options);
}

Rule includes(qb::json expected, const RuleOptions &options) {
    std::string message = "Array must include " + expected.dump() + ".";
    return Rule::base(codes::INCLUDES,
                      [expected = std::move(expected)](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_array()) return true;
                          return std::find(value->begin(), value->end(), expected) != value->end();
                      },
                      fixed(std::move(message)), options);
}

Rule tuple(std::vector<std::vector<Rule>> positions, TupleOptions tuple_options, const RuleOptions &options) {
    for (const auto &chain : positions) require_check_chain(chain, "tuple");
    require_check_chain(tuple_options.rest, "tuple");
    auto shape = std::make_shared<const TupleShape>(TupleShape{std::move(positions), std::move(tuple_options)});
    return Rule::base(codes::TUPLE,
                      [shape](const qb::json *value, const EvalContext &ctx) {
                          if (!value || !value->is_array()) return true;
                          return inspect_tuple(*shape, *value, ctx, "", nullptr);
                      },
                      [shape](const MessageContext &ctx) {
                          std::string message = "Tuple is invalid.";
                          if (ctx.value && ctx.value->is_array()) {
                              inspect_tuple(*shape, *ctx.value, ctx.eval, ctx.path, &message);
                          }
                          return message;
                      },
                      options);
}

// --- values ---

Rule one_of(qb::json allowed, const RuleOptions &options) {
    if (!allowed.is_array() || allowed.empty()) {
        throw std::invalid_argument("one_of requires a non-empty array of allowed values.");
    }
    std::string message = "Value must be one of: " + allowed.dump() + ".";
    return Rule::base(codes::ENUM,
                      [allowed = std::move(allowed)](const qb::json *value, const EvalContext &) {
                          if (!value) return true;
                          return std::find(allowed.begin(), allowed.end(), *value) != allowed.end();
                      },
                      fixed(std::move(message)), options);
}

Rule literal(qb::json expected, const RuleOptions &options) {
    std::string message = "Value must be " + expected.dump() + ".";
    return Rule::base(codes::CONST,
                      [expected = std::move(expected)](const qb::json *value, const EvalContext &) {
                          return !value || *value == expected;
                      },
                      fixed(std::move(message)), options);
}

Rule union_guard(std::vector<UnionBranch> branches, const RuleOptions &options) {
    if (branches.empty()) {
        throw std::invalid_argument("union_guard requires at least one branch.");
    }
    for (const auto &branch : branches) {
        if (!branch.guard) {
            throw std::invalid_argument("union_guard branches require a guard.");
        }
        require_check_chain(branch.chain, "union_guard");
    }
    auto shared = std::make_shared<const std::vector<UnionBranch>>(std::move(branches));
    auto select = [shared](const qb::json &value) -> const UnionBranch * {
        for (const auto &branch : *shared) {
            if (branch.guard(value)) return &branch;
        }
        return nullptr;
    };
    return Rule::base(codes::UNION_GUARD,
                      [select](const qb::json *value, const EvalContext &ctx) {
                          if (!value) return true;
                          const UnionBranch *branch = select(*value);
                          return branch && !first_failure(branch->chain, value, ctx);
                      },
                      [select](const MessageContext &ctx) {
                          if (ctx.value) {
                              if (const UnionBranch *branch = select(*ctx.value)) {
                                  if (const Rule *failed = first_failure(branch->chain, ctx.value, ctx.eval)) {
                                      return failed->message(ctx.value, ctx.path, ctx.eval);
                                  }
                              }
                          }
                          return std::string("Value does not match any union type guard.");
                      },
                      options);
}

// --- objects ---

Rule min_properties(std::size_t count, const RuleOptions &options) {
    return Rule::base(codes::MIN_PROPERTIES,
                      [count](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_object() || value->size() >= count;
                      },
                      fixed("Object must have at least " + std::to_string(count) + " properties."), options);
}

Rule max_properties(std::size_t count, const RuleOptions &options) {
    return Rule::base(codes::MAX_PROPERTIES,
                      [count](const qb::json *value, const EvalContext &) {
                          return !value || !value->is_object() || value->size() <= count;
                      },
                      fixed("Object must have at most " + std::to_string(count) + " properties."), options);
}

Rule allowed_properties(std::vector<std::string> names, std::vector<std::string> patterns,
                        const RuleOptions &options) {
    qb::unordered_set<std::string> known(names.begin(), names.end());
    std::vector<std::regex> compiled;
    for (const auto &p : patterns) {
        try {
            compiled.emplace_back(p, std::regex_constants::ECMAScript | std::regex_constants::optimize);
        } catch (const std::regex_error &e) {
            throw std::invalid_argument("Invalid property pattern: '" + p + "'. Error: " + e.what());
        }
    }
    auto is_allowed = [known = std::move(known), compiled = std::move(compiled)](const std::string &key) {
        if (known.count(key)) return true;
        return std::any_of(compiled.begin(), compiled.end(),
                           [&key](const std::regex &re) { return std::regex_search(key, re); });
    };
    auto message = [is_allowed](const MessageContext &ctx) {
        if (ctx.value && ctx.value->is_object()) {
            for (auto const &[key, _] : ctx.value->items()) {
                if (!is_allowed(key)) return "Additional property '" + key + "' not allowed.";
            }
        }
        return std::string("Additional properties not allowed.");
    };
    return Rule::base(codes::ADDITIONAL_PROPERTIES,
                      [is_allowed](const qb::json *value, const EvalContext &) {
                          if (!value || !value->is_object()) return true;
                          for (auto const &[key, _] : value->items()) {
                              if (!is_allowed(key)) return false;
                          }
                          return true;
                      },
                      std::move(message), options);
}

// --- cross field and context ---

Rule compare_field(std::string other_path, const RuleOptions &options) {
    const FieldPath other(other_path);
    if (other.has_wildcard()) {
        throw std::invalid_argument("compare_field path must not contain wildcards: '" + other_path + "'.");
    }
    return Rule::conditional(codes::COMPARE_FIELD,
                             [other](const qb::json *value, const EvalContext &ctx) {
                                 if (!value) return true;
                                 const qb::json *expected = find_value(ctx.all_values, other.segments());
                                 return expected && *expected == *value;
                             },
                             fixed("Value must match field '" + other_path + "'."), options);
}

Rule required_if(ConditionFn condition, const RuleOptions &options) {
    if (!condition) {
        throw std::invalid_argument("required_if requires a condition.");
    }
    return Rule::conditional(codes::REQUIRED_IF,
                             [condition = std::move(condition)](const qb::json *value, const EvalContext &ctx) {
                                 if (!condition(ctx)) return true;
                                 return value && !value->is_null() && !is_blank_string(*value);
                             },
                             fixed("Field is required when condition is met."), options);
}

Rule from_context(ContextCheckFn check, FromContextOptions options) {
    if (!check) {
        throw std::invalid_argument("from_context requires a validation function.");
    }
    auto verdict = [check, required = options.required,
                    fallback = options.fallback_to_valid](const qb::json *value, const EvalContext &ctx) {
        if (ctx.context.is_null()) {
            if (required) return ContextVerdict{false, "Context data is required for validation"};
            return ContextVerdict{fallback, {}};
        }
        return check(value, ctx.context, ctx.all_values);
    };
    RuleOptions rule_options(options.code);
    rule_options.message_factory = [verdict, error_message = options.error_message](const MessageContext &ctx) {
        std::string message;
        try {
            message = verdict(ctx.value, ctx.eval).message;
        } catch (const std::exception &e) {
            message = std::string("Context validation error: ") + e.what();
        }
        if (!message.empty()) return message;
        return error_message.empty() ? std::string("Context validation failed") : error_message;
    };
    return Rule::conditional(codes::CONTEXT,
                             [verdict](const qb::json *value, const EvalContext &ctx) {
                                 return verdict(value, ctx).valid;
                             },
                             nullptr, rule_options);
}

Rule read_only(const RuleOptions &options) {
    return Rule::conditional(codes::READ_ONLY,
                             [](const qb::json *value, const EvalContext &ctx) {
                                 if (!value || !ctx.context.is_object()) return true;
                                 const std::string operation = ctx.context.value("operation", std::string("write"));
                                 const bool is_update = ctx.context.value("isUpdate", false);
                                 return !(operation == "write" && is_update);
                             },
                             [](const MessageContext &ctx) {
                                 return ctx.path + " is read-only and cannot be modified";
                             },
                             options);
}

Rule write_only(const RuleOptions &options) {
    return Rule::conditional(codes::WRITE_ONLY,
                             [](const qb::json *value, const EvalContext &ctx) {
                                 if (!value || !ctx.context.is_object()) return true;
                                 return ctx.context.value("operation", std::string("write")) != "read";
                             },
                             [](const MessageContext &ctx) {
                                 return ctx.path + " is write-only and cannot be read";
                             },
                             options);
}

// --- escape hatches ---

Rule custom(std::string code, ValueCheckFn check, std::string message, const RuleOptions &options) {
    if (!check) {
        throw std::invalid_argument("custom rule '" + code + "' requires a check function.");
    }
    if (code.empty()) code = codes::CUSTOM;
    if (message.empty()) message = "Custom validation '" + code + "' failed.";
    return Rule::conditional(std::move(code),
                             [check = std::move(check)](const qb::json *value, const EvalContext &ctx) {
                                 return !value || check(*value, ctx);
                             },
                             fixed(std::move(message)), options);
}

Rule recursively(RecursionTarget target, std::size_t max_depth) {
    return Rule::recursive(target, max_depth);
}

Rule transform(TransformFn fn) {
    return Rule::transform(std::move(fn));
}

} // namespace rules
} // namespace qb::validation
