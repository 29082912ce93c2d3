#include "./transforms.h"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <stdexcept>

namespace qb::validation::transforms {
namespace {

std::string trim_string(const std::string &input) {
    auto first_char = std::find_if_not(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
    if (first_char == input.end()) {
        return "";
    }
    auto last_char =
        std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return std::string(first_char, last_char);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

TransformFn on_string(StringTransform fn) {
    if (!fn) {
        throw std::invalid_argument("on_string requires a function.");
    }
    return [fn = std::move(fn)](const qb::json &value) -> qb::json {
        if (!value.is_string()) return value;
        return fn(value.get<std::string>());
    };
}

TransformFn trim() {
    return on_string(trim_string);
}

TransformFn to_lower_case() {
    return on_string([](const std::string &input) { return lower(input); });
}

TransformFn to_upper_case() {
    return on_string([](const std::string &input) {
        std::string output = input;
        std::transform(output.begin(), output.end(), output.begin(), [](unsigned char c) { return std::toupper(c); });
        return output;
    });
}

TransformFn escape_html() {
    return on_string([](const std::string &input) {
        std::string buffer;
        buffer.reserve(input.size());
        for (char c : input) {
            switch (c) {
                case '&':  buffer.append("&amp;");  break;
                case '<':  buffer.append("&lt;");   break;
                case '>':  buffer.append("&gt;");   break;
                case '\"': buffer.append("&quot;"); break;
                case '\'': buffer.append("&#39;");  break;
                default:   buffer.push_back(c);     break;
            }
        }
        return buffer;
    });
}

TransformFn strip_html_tags() {
    return on_string([](const std::string &input) {
        static const std::regex html_tags_regex("<[^>]*>", std::regex_constants::ECMAScript);
        return std::regex_replace(input, html_tags_regex, "");
    });
}

TransformFn alphanumeric_only() {
    return on_string([](const std::string &input) {
        std::string output;
        output.reserve(input.length());
        std::copy_if(input.begin(), input.end(), std::back_inserter(output),
                     [](unsigned char c) { return std::isalnum(c) != 0; });
        return output;
    });
}

TransformFn normalize_whitespace() {
    return on_string([](const std::string &input) {
        const std::string trimmed = trim_string(input);
        std::string output;
        output.reserve(trimmed.length());
        bool last_was_space = false;
        for (char c : trimmed) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!last_was_space) output += ' ';
                last_was_space = true;
            } else {
                output += c;
                last_was_space = false;
            }
        }
        return output;
    });
}

TransformFn to_number() {
    return [](const qb::json &value) -> qb::json {
        if (!value.is_string()) return value;
        const std::string text = trim_string(value.get<std::string>());
        if (text.empty()) return value;
        const auto parsed = qb::json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_number()) return value;
        return parsed;
    };
}

TransformFn to_boolean() {
    return [](const qb::json &value) -> qb::json {
        if (!value.is_string()) return value;
        const std::string text = lower(trim_string(value.get<std::string>()));
        if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
        if (text == "false" || text == "0" || text == "no" || text == "off") return false;
        return value;
    };
}

} // namespace qb::validation::transforms
