/**
 * @file qbm/validation/jsonschema/ref_resolver.h
 * @brief Resolution of local `$ref` JSON pointers (`#`, `#/definitions/node`).
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <string>
#include <vector>
#include <qb/json.h>
#include "./error.h"

namespace qb::validation::jsonschema {

class RefResolver {
private:
    const qb::json &_root;

public:
    /// `root` must outlive the resolver and every node it returned.
    explicit RefResolver(const qb::json &root)
        : _root(root) {}

    /**
     * @brief Node designated by `ref`.
     * @throws ExternalRefError if `ref` does not start with '#'.
     * @throws UnresolvedRefError if a pointer segment does not exist.
     */
    [[nodiscard]] const qb::json &resolve(const std::string &ref) const;

    [[nodiscard]] const qb::json &root() const { return _root; }

    /// The `$ref` string of `node`, or an empty string.
    static std::string ref_of(const qb::json &node);

    /// RFC 6901 segments of the fragment (`~1` -> '/', `~0` -> '~', %XX decoded).
    static std::vector<std::string> split_pointer(const std::string &pointer);
};

} // namespace qb::validation::jsonschema
