/**
 * @file qbm/validation/types.h
 * @brief Core value types shared by every stage of the validation engine.
 *
 * Declares the `DataType` tag used by type predicates, the `ArrayContext`
 * produced while expanding wildcard segments, and the `EvalContext` handed to
 * every predicate check.
 *
 * Values are `qb::json`. An *undefined* value (absent key, out-of-range index,
 * missing parent) is modelled by a null `const qb::json *`, which keeps it
 * distinct from the JSON `null` literal.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <qb/json.h>

namespace qb::validation {

/**
 * @brief JSON data types understood by type predicates.
 */
enum class DataType {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    OBJECT,
    ARRAY,
    NUL,
    ANY
};

inline std::string data_type_to_string(DataType dt) noexcept {
    switch (dt) {
        case DataType::STRING: return "string";
        case DataType::INTEGER: return "integer";
        case DataType::NUMBER: return "number";
        case DataType::BOOLEAN: return "boolean";
        case DataType::OBJECT: return "object";
        case DataType::ARRAY: return "array";
        case DataType::NUL: return "null";
        case DataType::ANY: return "any";
    }
    return "unknown";
}

/**
 * @brief Whole numbers stored as floating point (e.g. `2.0`) count as integers.
 */
inline bool is_integral(const qb::json &value) noexcept {
    if (value.is_number_integer()) return true;
    if (!value.is_number_float()) return false;
    const double d = value.get<double>();
    return std::isfinite(d) && std::floor(d) == d;
}

inline bool matches_type(const qb::json &value, DataType dt) noexcept {
    switch (dt) {
        case DataType::STRING: return value.is_string();
        case DataType::INTEGER: return is_integral(value);
        case DataType::NUMBER: return value.is_number();
        case DataType::BOOLEAN: return value.is_boolean();
        case DataType::OBJECT: return value.is_object();
        case DataType::ARRAY: return value.is_array();
        case DataType::NUL: return value.is_null();
        case DataType::ANY: return true;
    }
    return false;
}

/**
 * @brief Position of the value being validated inside the innermost array
 *        traversed by the path resolver.
 */
struct ArrayContext {
    std::size_t index = 0;
    const qb::json *item = nullptr;
    const qb::json *array = nullptr;
};

/**
 * @brief Everything a predicate may look at besides its own value.
 *
 * `all_values` is the document currently being validated (the nested value
 * when a recursive rule re-applies the field set). `parent` is the container
 * that holds (or would hold) the value, `array` the innermost array context
 * and `context` the caller supplied context from `ValidationOptions`.
 */
struct EvalContext {
    const qb::json &all_values;
    const qb::json &context;
    const ArrayContext *array = nullptr;
    const qb::json *parent = nullptr;

    EvalContext(const qb::json &values, const qb::json &ctx,
                const ArrayContext *array_ctx = nullptr, const qb::json *parent_node = nullptr)
        : all_values(values), context(ctx), array(array_ctx), parent(parent_node) {}
};

} // namespace qb::validation
