/**
 * @file qbm/validation/path/field_path.h
 * @brief Field path grammar and resolution against a `qb::json` document.
 *
 * A field path is a list of dot separated segments. A segment is a key that
 * may carry one or more bracket suffixes: a literal index (`[3]`) or the
 * wildcard (`[*]`) that expands to every element of the array at that
 * position. Examples: `user.name`, `items[*].price`, `matrix[0][*]`, `[1].id`.
 * The empty path denotes the document itself.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <qb/json.h>
#include "../types.h"

namespace qb::validation {

/**
 * @brief One step of a field path.
 */
struct PathSegment {
    enum class Kind {
        Key,
        Index,
        Wildcard
    };

    Kind kind = Kind::Key;
    std::string key;
    std::size_t index = 0;

    static PathSegment make_key(std::string name) {
        PathSegment s;
        s.kind = Kind::Key;
        s.key = std::move(name);
        return s;
    }

    static PathSegment make_index(std::size_t i) {
        PathSegment s;
        s.kind = Kind::Index;
        s.index = i;
        return s;
    }

    static PathSegment make_wildcard() {
        PathSegment s;
        s.kind = Kind::Wildcard;
        return s;
    }

    bool operator==(const PathSegment &rhs) const {
        return kind == rhs.kind && key == rhs.key && index == rhs.index;
    }
};

/**
 * @brief A concrete location produced by `FieldPath::resolve`.
 *
 * `value` is null when the location is undefined (final key absent from an
 * existing object). `segments` never contain wildcards.
 */
struct ResolvedLocation {
    const qb::json *value = nullptr;
    const qb::json *parent = nullptr;
    std::string path;
    std::vector<PathSegment> segments;
    std::vector<std::size_t> indices;
    std::optional<ArrayContext> array_context;

    [[nodiscard]] bool defined() const { return value != nullptr; }
};

/**
 * @brief Parsed, immutable field path.
 *
 * @throws std::invalid_argument from the constructor on malformed syntax
 *         (empty segment, unterminated or non-numeric bracket).
 */
class FieldPath {
private:
    std::string _text;
    std::vector<PathSegment> _segments;
    bool _has_wildcard = false;

    void resolve_from(const qb::json &node,
                      const qb::json *parent,
                      std::size_t segment_idx,
                      ResolvedLocation &current,
                      std::vector<ResolvedLocation> &out) const;
    void descend_into_element(const qb::json &array,
                              std::size_t index,
                              std::size_t segment_idx,
                              ResolvedLocation &current,
                              std::vector<ResolvedLocation> &out) const;

public:
    FieldPath() = default;
    explicit FieldPath(std::string text);

    [[nodiscard]] const std::string &text() const { return _text; }
    [[nodiscard]] const std::vector<PathSegment> &segments() const { return _segments; }
    [[nodiscard]] bool has_wildcard() const { return _has_wildcard; }
    [[nodiscard]] bool is_root() const { return _segments.empty(); }

    /**
     * @brief Every concrete location this path denotes in `root`.
     *
     * Missing, null or non-container intermediate segments, wildcards over a
     * non-array and out-of-range indices yield no location. A final key absent
     * from an existing object yields one undefined location. Never throws.
     */
    [[nodiscard]] std::vector<ResolvedLocation> resolve(const qb::json &root) const;

    /**
     * @brief The undefined location at the template path, used for paths
     *        without wildcards that resolved to nothing.
     */
    [[nodiscard]] ResolvedLocation unresolved() const;

    static std::vector<PathSegment> parse(const std::string &text);
    static std::string to_string(const std::vector<PathSegment> &segments);

    /**
     * @brief Concatenates two path strings (`a` + `b` -> `a.b`, `a` + `[0].b` -> `a[0].b`).
     */
    static std::string join(const std::string &parent, const std::string &child);
};

/**
 * @brief Value stored at `segments` inside `root`, or nullptr.
 */
const qb::json *find_value(const qb::json &root, const std::vector<PathSegment> &segments);

/**
 * @brief Writes `value` at `segments` inside `root`, creating intermediate
 *        objects and padding arrays with null where needed.
 * @return false when an existing intermediate value is neither an object nor
 *         an array as required (nothing is written).
 */
bool set_value(qb::json &root, const std::vector<PathSegment> &segments, qb::json value);

} // namespace qb::validation
