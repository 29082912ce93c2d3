#include "./ref_resolver.h"
#include <cctype>
#include "../logger.h"

namespace qb::validation::jsonschema {
namespace {

std::string percent_decode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

std::string unescape(const std::string &segment) {
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                out += '/';
                ++i;
                continue;
            }
            if (segment[i + 1] == '0') {
                out += '~';
                ++i;
                continue;
            }
        }
        out += segment[i];
    }
    return out;
}

} // namespace

std::vector<std::string> RefResolver::split_pointer(const std::string &pointer) {
    std::vector<std::string> segments;
    if (pointer.empty()) return segments;
    std::size_t start = pointer.front() == '/' ? 1 : 0;
    while (start <= pointer.size()) {
        const auto slash = pointer.find('/', start);
        const std::string raw = pointer.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        segments.push_back(unescape(percent_decode(raw)));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return segments;
}

std::string RefResolver::ref_of(const qb::json &node) {
    if (!node.is_object()) return {};
    const auto it = node.find("$ref");
    if (it == node.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

const qb::json &RefResolver::resolve(const std::string &ref) const {
    if (ref.empty() || ref.front() != '#') {
        LOG_VALIDATION_WARN("Rejecting external $ref '" << ref << "'.");
        throw ExternalRefError(ref);
    }

    const qb::json *node = &_root;
    for (const auto &segment : split_pointer(ref.substr(1))) {
        if (node->is_object()) {
            auto it = node->find(segment);
            // definitions and $defs are interchangeable containers
            if (it == node->end() && (segment == "definitions" || segment == "$defs")) {
                it = node->find(segment == "definitions" ? "$defs" : "definitions");
            }
            if (it == node->end()) {
                LOG_VALIDATION_WARN("Unresolvable $ref '" << ref << "' (missing '" << segment << "').");
                throw UnresolvedRefError(ref);
            }
            node = &*it;
        } else if (node->is_array() && !segment.empty() &&
                   segment.find_first_not_of("0123456789") == std::string::npos &&
                   segment.size() < 10 && std::stoul(segment) < node->size()) {
            node = &(*node)[std::stoul(segment)];
        } else {
            LOG_VALIDATION_WARN("Unresolvable $ref '" << ref << "' (cannot descend into '" << segment << "').");
            throw UnresolvedRefError(ref);
        }
    }
    return *node;
}

} // namespace qb::validation::jsonschema
