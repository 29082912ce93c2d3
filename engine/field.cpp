#include "./field.h"
#include <stdexcept>

namespace qb::validation {

FieldDefinition::FieldDefinition(const std::string &path, std::vector<Rule> rules)
    : _path(path), _rules(std::move(rules)) {}

qb::json FieldDefinition::materialize_default() const {
    if (const auto *value = std::get_if<qb::json>(&_default)) {
        return *value;
    }
    if (const auto *generator = std::get_if<DefaultGenerator>(&_default)) {
        return (*generator)();
    }
    throw std::logic_error("Field '" + _path.text() + "' has no default value.");
}

bool FieldDefinition::needs_default(const qb::json *value) const {
    if (!has_default()) return false;
    if (!value) return true;
    return value->is_null() && _default_options.apply_to_null;
}

FieldDefinition &FieldDefinition::add_rule(Rule rule) {
    _rules.push_back(std::move(rule));
    return *this;
}

FieldDefinition &FieldDefinition::set_default(qb::json value, DefaultOptions options) {
    _default = std::move(value);
    _default_options = options;
    return *this;
}

FieldDefinition &FieldDefinition::set_default(DefaultGenerator generator, DefaultOptions options) {
    if (!generator) {
        throw std::invalid_argument("Default generator of field '" + _path.text() + "' is empty.");
    }
    _default = std::move(generator);
    _default_options = options;
    return *this;
}

} // namespace qb::validation
