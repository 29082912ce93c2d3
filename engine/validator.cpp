/**
 * @file qbm/validation/engine/validator.cpp
 * @brief Implementation of the validation plan executor.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./validator.h"
#include "../logger.h"

namespace qb::validation {

Validator::Validator(std::vector<FieldDefinition> fields) {
    _fields.reserve(fields.size());
    std::size_t recursive_fields = 0;
    for (auto &definition : fields) {
        CompiledField compiled(definition.rules(), definition.path().text());
        if (compiled.recursion()) ++recursive_fields;
        _fields.push_back(Field{std::move(definition), std::move(compiled)});
    }
    LOG_VALIDATION_DEBUG("Validator built with " << _fields.size() << " fields (" << recursive_fields
                                                 << " recursive).");
}

std::vector<FieldDefinition> Validator::definitions() const {
    std::vector<FieldDefinition> out;
    out.reserve(_fields.size());
    for (const auto &field : _fields) out.push_back(field.definition);
    return out;
}

Result Validator::validate(const qb::json &data, const ValidationOptions &options) const {
    Result result;
    RunState state{options, result, nullptr};
    run(data, {}, 0, state);
    return result;
}

ParseResult Validator::parse(const qb::json &data, const ValidationOptions &options) const {
    ParseResult parsed;
    qb::json output = data;
    RunState state{options, parsed.result, &output};
    run(data, {}, 0, state);
    if (parsed.result.success()) {
        parsed.data = std::move(output);
    }
    return parsed;
}

bool Validator::run(const qb::json &root,
                    const std::vector<PathSegment> &prefix,
                    std::size_t depth,
                    RunState &state) const {
    for (const auto &field : _fields) {
        const FieldPath &path = field.definition.path();
        auto locations = path.resolve(root);
        // A path without wildcards always denotes one location, even when its parents are absent.
        if (locations.empty() && !path.has_wildcard()) {
            locations.push_back(path.unresolved());
        }
        for (const auto &location : locations) {
            if (!evaluate_location(field, location, root, prefix, depth, state)) {
                return false;
            }
        }
    }
    return true;
}

bool Validator::evaluate_location(const Field &field,
                                  const ResolvedLocation &location,
                                  const qb::json &root,
                                  const std::vector<PathSegment> &prefix,
                                  std::size_t depth,
                                  RunState &state) const {
    const auto &options = state.options;
    std::vector<PathSegment> segments = prefix;
    segments.insert(segments.end(), location.segments.begin(), location.segments.end());
    const std::string path = FieldPath::to_string(segments);

    auto report = [&state](Error error) {
        state.result.add_error(std::move(error));
        return !state.options.abort_early();
    };

    const qb::json *value = location.value;
    std::optional<qb::json> substituted;
    if (field.definition.needs_default(value)) {
        try {
            substituted = field.definition.materialize_default();
        } catch (const std::exception &e) {
            return report(Error(path, "default", std::string("Default value generation failed: ") + e.what()));
        }
        value = &*substituted;
    }

    const ArrayContext *array_context = location.array_context ? &*location.array_context : nullptr;
    const EvalContext ctx(root, options.context(), array_context, location.parent);
    FieldOutcome outcome = field.compiled.evaluate(value, path, ctx, !options.collects_every_predicate());

    if (!outcome.valid) {
        if (options.abort_early() || !options.collects_every_predicate()) {
            return report(std::move(outcome.errors.front()));
        }
        for (auto &error : outcome.errors) {
            state.result.add_error(std::move(error));
        }
        return true;
    }
    if (!value) return true;

    if (state.output && (substituted || field.compiled.has_transforms())) {
        qb::json final_value = *value;
        if (field.compiled.has_transforms() && !outcome.skipped) {
            std::string failure;
            auto transformed = field.compiled.apply_transforms(*value, failure);
            if (!transformed) {
                return report(Error(path, codes::TRANSFORM, failure, *value));
            }
            final_value = std::move(*transformed);
        }
        if (!set_value(*state.output, segments, std::move(final_value))) {
            LOG_VALIDATION_WARN("Could not write parsed value at '" << path << "'.");
        }
    }

    if (!outcome.skipped && field.compiled.recursion()) {
        return recurse(*field.compiled.recursion(), *value, std::move(segments), depth, state);
    }
    return true;
}

bool Validator::recurse(const Rule &recursion,
                        const qb::json &value,
                        std::vector<PathSegment> segments,
                        std::size_t depth,
                        RunState &state) const {
    if (depth + 1 > recursion.max_depth()) {
        LOG_VALIDATION_DEBUG("Recursion stopped at '" << FieldPath::to_string(segments) << "' (max depth "
                                                      << recursion.max_depth() << ").");
        return true;
    }
    // Every nested value is held to the whole field set, scalars included:
    // keyed paths resolve to nothing on them and root paths check them.
    if (recursion.target() == RecursionTarget::SelfValue) {
        return run(value, segments, depth + 1, state);
    }
    if (!value.is_array()) return true;
    for (std::size_t i = 0; i < value.size(); ++i) {
        segments.push_back(PathSegment::make_index(i));
        const bool keep_going = run(value[i], segments, depth + 1, state);
        segments.pop_back();
        if (!keep_going) return false;
    }
    return true;
}

ValidatorBuilder &ValidatorBuilder::field(const std::string &path,
                                          const std::function<void(FieldBuilder &)> &configure) {
    FieldBuilder builder(path);
    if (configure) configure(builder);
    _fields.push_back(builder.build());
    return *this;
}

ValidatorBuilder &ValidatorBuilder::add(FieldDefinition definition) {
    _fields.push_back(std::move(definition));
    return *this;
}

ValidatorBuilder &ValidatorBuilder::add(std::vector<FieldDefinition> definitions) {
    for (auto &definition : definitions) {
        _fields.push_back(std::move(definition));
    }
    return *this;
}

Validator ValidatorBuilder::build() const {
    return Validator(_fields);
}

} // namespace qb::validation
