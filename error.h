/**
 * @file qbm/validation/error.h
 * @brief Validation error records, result aggregation and construction errors.
 *
 * `Error` and `Result` carry validation-time failures, which are data and are
 * never thrown. Construction-time problems (bad predicate parameters, malformed
 * rule chains) are reported with exceptions deriving from `std::invalid_argument`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <qb/json.h>

namespace qb::validation {

/**
 * @brief A single failed predicate at a concrete location.
 */
struct Error {
    std::string field_path;
    std::string rule_violated;
    std::string message;
    std::optional<qb::json> offending_value;

    Error(std::string path,
          std::string rule,
          std::string msg,
          std::optional<qb::json> value = std::nullopt)
        : field_path(std::move(path)),
          rule_violated(std::move(rule)),
          message(std::move(msg)),
          offending_value(std::move(value)) {}
};

/**
 * @brief Ordered collection of validation errors.
 */
class Result {
private:
    std::vector<Error> _errors;

public:
    Result() = default;

    /**
     * @brief Checks if the validation was successful (no errors).
     */
    [[nodiscard]] bool success() const {
        return _errors.empty();
    }

    [[nodiscard]] const std::vector<Error> &errors() const {
        return _errors;
    }

    void add_error(std::string field_path,
                   std::string rule_violated,
                   std::string message,
                   std::optional<qb::json> offending_value = std::nullopt) {
        _errors.emplace_back(std::move(field_path), std::move(rule_violated), std::move(message),
                             std::move(offending_value));
    }

    void add_error(Error validation_error) {
        _errors.push_back(std::move(validation_error));
    }

    void clear() {
        _errors.clear();
    }

    /**
     * @brief Appends the errors of `other` after the ones already recorded.
     */
    void merge(const Result &other) {
        if (other._errors.empty()) return;
        _errors.insert(_errors.end(), other._errors.begin(), other._errors.end());
    }
};

/**
 * @brief Thrown when a rule chain cannot be compiled (misplaced or repeated
 *        recursive marker).
 */
class RuleChainError : public std::invalid_argument {
public:
    explicit RuleChainError(const std::string &what)
        : std::invalid_argument(what) {}
};

} // namespace qb::validation
