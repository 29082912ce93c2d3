/**
 * @file qbm/validation/path/field_path.cpp
 * @brief Implementation of field path parsing and resolution.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./field_path.h"
#include <stdexcept>

namespace qb::validation {

FieldPath::FieldPath(std::string text)
    : _text(std::move(text)), _segments(parse(_text)) {
    for (const auto &segment : _segments) {
        if (segment.kind == PathSegment::Kind::Wildcard) {
            _has_wildcard = true;
            break;
        }
    }
}

std::vector<PathSegment> FieldPath::parse(const std::string &text) {
    std::vector<PathSegment> segments;
    if (text.empty()) return segments;

    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        std::string key;
        while (i < n && text[i] != '.' && text[i] != '[' && text[i] != ']') {
            key += text[i++];
        }
        if (i < n && text[i] == ']') {
            throw std::invalid_argument("Invalid field path '" + text + "': unexpected ']' at position " +
                                        std::to_string(i) + ".");
        }
        if (!key.empty()) {
            segments.push_back(PathSegment::make_key(std::move(key)));
        } else if (!(i == 0 && text[i] == '[')) {
            // Only a leading bracket may omit its key ("[0].name").
            throw std::invalid_argument("Invalid field path '" + text + "': empty segment at position " +
                                        std::to_string(i) + ".");
        }

        while (i < n && text[i] == '[') {
            const auto close = text.find(']', i);
            if (close == std::string::npos) {
                throw std::invalid_argument("Invalid field path '" + text + "': unterminated '['.");
            }
            const std::string content = text.substr(i + 1, close - i - 1);
            if (content == "*") {
                segments.push_back(PathSegment::make_wildcard());
            } else if (!content.empty() &&
                       content.size() < 19 &&
                       content.find_first_not_of("0123456789") == std::string::npos) {
                segments.push_back(PathSegment::make_index(std::stoul(content)));
            } else {
                throw std::invalid_argument("Invalid field path '" + text + "': bracket must hold an index or '*', got '" +
                                            content + "'.");
            }
            i = close + 1;
        }

        if (i < n) {
            if (text[i] != '.') {
                throw std::invalid_argument("Invalid field path '" + text + "': unexpected '" +
                                            std::string(1, text[i]) + "' at position " + std::to_string(i) + ".");
            }
            ++i;
            if (i == n) {
                throw std::invalid_argument("Invalid field path '" + text + "': trailing '.'.");
            }
        }
    }
    return segments;
}

std::string FieldPath::to_string(const std::vector<PathSegment> &segments) {
    std::string out;
    for (const auto &segment : segments) {
        switch (segment.kind) {
            case PathSegment::Kind::Key:
                if (!out.empty()) out += '.';
                out += segment.key;
                break;
            case PathSegment::Kind::Index:
                out += '[' + std::to_string(segment.index) + ']';
                break;
            case PathSegment::Kind::Wildcard:
                out += "[*]";
                break;
        }
    }
    return out;
}

std::string FieldPath::join(const std::string &parent, const std::string &child) {
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    if (child.front() == '[') return parent + child;
    return parent + "." + child;
}

std::vector<ResolvedLocation> FieldPath::resolve(const qb::json &root) const {
    std::vector<ResolvedLocation> out;
    ResolvedLocation current;
    resolve_from(root, nullptr, 0, current, out);
    return out;
}

void FieldPath::resolve_from(const qb::json &node,
                             const qb::json *parent,
                             std::size_t segment_idx,
                             ResolvedLocation &current,
                             std::vector<ResolvedLocation> &out) const {
    if (segment_idx == _segments.size()) {
        ResolvedLocation location = current;
        location.value = &node;
        location.parent = parent;
        location.path = to_string(location.segments);
        out.push_back(std::move(location));
        return;
    }

    const PathSegment &segment = _segments[segment_idx];
    switch (segment.kind) {
        case PathSegment::Kind::Key: {
            if (!node.is_object()) return;
            const auto it = node.find(segment.key);
            current.segments.push_back(segment);
            if (it != node.end()) {
                resolve_from(*it, &node, segment_idx + 1, current, out);
            } else if (segment_idx + 1 == _segments.size()) {
                ResolvedLocation location = current;
                location.value = nullptr;
                location.parent = &node;
                location.path = to_string(location.segments);
                out.push_back(std::move(location));
            }
            current.segments.pop_back();
            return;
        }
        case PathSegment::Kind::Index: {
            if (!node.is_array() || segment.index >= node.size()) return;
            descend_into_element(node, segment.index, segment_idx, current, out);
            return;
        }
        case PathSegment::Kind::Wildcard: {
            if (!node.is_array()) return;
            for (std::size_t i = 0; i < node.size(); ++i) {
                descend_into_element(node, i, segment_idx, current, out);
            }
            return;
        }
    }
}

void FieldPath::descend_into_element(const qb::json &array,
                                     std::size_t index,
                                     std::size_t segment_idx,
                                     ResolvedLocation &current,
                                     std::vector<ResolvedLocation> &out) const {
    const qb::json &element = array[index];
    const auto saved_context = current.array_context;
    current.segments.push_back(PathSegment::make_index(index));
    current.indices.push_back(index);
    current.array_context = ArrayContext{index, &element, &array};
    resolve_from(element, &array, segment_idx + 1, current, out);
    current.array_context = saved_context;
    current.indices.pop_back();
    current.segments.pop_back();
}

ResolvedLocation FieldPath::unresolved() const {
    ResolvedLocation location;
    location.segments = _segments;
    location.path = to_string(_segments);
    return location;
}

const qb::json *find_value(const qb::json &root, const std::vector<PathSegment> &segments) {
    const qb::json *node = &root;
    for (const auto &segment : segments) {
        if (segment.kind == PathSegment::Kind::Key) {
            if (!node->is_object()) return nullptr;
            const auto it = node->find(segment.key);
            if (it == node->end()) return nullptr;
            node = &*it;
        } else if (segment.kind == PathSegment::Kind::Index) {
            if (!node->is_array() || segment.index >= node->size()) return nullptr;
            node = &(*node)[segment.index];
        } else {
            return nullptr;
        }
    }
    return node;
}

bool set_value(qb::json &root, const std::vector<PathSegment> &segments, qb::json value) {
    qb::json *node = &root;
    for (const auto &segment : segments) {
        if (segment.kind == PathSegment::Kind::Key) {
            if (node->is_null()) *node = qb::json::object();
            if (!node->is_object()) return false;
            node = &(*node)[segment.key];
        } else if (segment.kind == PathSegment::Kind::Index) {
            if (node->is_null()) *node = qb::json::array();
            if (!node->is_array()) return false;
            while (node->size() <= segment.index) node->push_back(nullptr);
            node = &(*node)[segment.index];
        } else {
            return false;
        }
    }
    *node = std::move(value);
    return true;
}

} // namespace qb::validation
