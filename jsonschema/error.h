/**
 * @file qbm/validation/jsonschema/error.h
 * @brief Construction-time errors raised while adapting a JSON Schema.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <stdexcept>
#include <string>

namespace qb::validation::jsonschema {

/**
 * @brief The schema document itself is invalid (wrong keyword shape, bad regex...).
 */
class SchemaError : public std::invalid_argument {
public:
    explicit SchemaError(const std::string &what)
        : std::invalid_argument(what) {}
};

/**
 * @brief A `$ref` points outside the current document.
 */
class ExternalRefError : public SchemaError {
private:
    std::string _ref;

public:
    explicit ExternalRefError(const std::string &ref)
        : SchemaError("External $ref not supported: " + ref), _ref(ref) {}

    [[nodiscard]] const std::string &ref() const { return _ref; }
};

/**
 * @brief A local `$ref` pointer does not designate anything in the document.
 */
class UnresolvedRefError : public SchemaError {
private:
    std::string _ref;

public:
    explicit UnresolvedRefError(const std::string &ref)
        : SchemaError("Cannot resolve $ref: " + ref), _ref(ref) {}

    [[nodiscard]] const std::string &ref() const { return _ref; }
};

} // namespace qb::validation::jsonschema
