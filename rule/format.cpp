#include "./format.h"
#include <cstdlib>
#include <regex>
#include "../logger.h"

namespace qb::validation::formats {
namespace {

constexpr auto kFlags = std::regex_constants::ECMAScript | std::regex_constants::optimize;

const std::regex &email_re() {
    static const std::regex re(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)", kFlags);
    return re;
}
const std::regex &scheme_re() {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):(.+)$)", kFlags);
    return re;
}
const std::regex &url_re() {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9+.-]*://[^\s/$.?#][^\s]*$)", kFlags);
    return re;
}
const std::regex &uuid_re() {
    static const std::regex re(
        R"(^[0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$)",
        kFlags | std::regex_constants::icase);
    return re;
}
const std::regex &date_re() {
    static const std::regex re(R"(^(\d{4})-(\d{2})-(\d{2})$)", kFlags);
    return re;
}
const std::regex &date_time_re() {
    static const std::regex re(
        R"(^(\d{4}-\d{2}-\d{2})[Tt](\d{2}:\d{2}:\d{2}(\.\d+)?)([Zz]|[+-]\d{2}:\d{2})?$)", kFlags);
    return re;
}
const std::regex &time_re() {
    static const std::regex re(R"(^(\d{2}):(\d{2}):(\d{2})(\.\d+)?$)", kFlags);
    return re;
}
const std::regex &duration_re() {
    static const std::regex re(
        R"(^P(?:(\d+Y)?(\d+M)?(\d+W)?(\d+D)?)(?:T(\d+H)?(\d+M)?(\d+(?:\.\d+)?S)?)?$)", kFlags);
    return re;
}
const std::regex &ipv4_re() {
    static const std::regex re(
        R"(^((25[0-5]|(2[0-4]|1\d|[1-9]|)\d)\.){3}(25[0-5]|(2[0-4]|1\d|[1-9]|)\d)$)", kFlags);
    return re;
}
const std::regex &ipv6_re() {
    static const std::regex re(R"(^([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}$)", kFlags);
    return re;
}
const std::regex &hostname_re() {
    static const std::regex re(
        R"(^[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(\.[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)",
        kFlags);
    return re;
}
const std::regex &json_pointer_re() {
    static const std::regex re(R"(^(/([^/~]|~[01])*)*$)", kFlags);
    return re;
}
const std::regex &relative_json_pointer_re() {
    static const std::regex re(R"(^(0|[1-9][0-9]*)(#|(/([^/~]|~[01])*)*)$)", kFlags);
    return re;
}
const std::regex &iri_re() {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9+.-]*:[^\s]*$)", kFlags);
    return re;
}
const std::regex &iri_reference_re() {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*:[^\s]*|/[^\s]*|[^\s:/]+)$)", kFlags);
    return re;
}
const std::regex &uri_template_re() {
    static const std::regex re(R"(^[^{}]*(\{[^{}]+\}[^{}]*)*$)", kFlags);
    return re;
}
const std::regex &base64_re() {
    static const std::regex re(R"(^[A-Za-z0-9+/]*={0,2}$)", kFlags);
    return re;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool valid_calendar_date(const std::string &value) {
    std::smatch m;
    if (!std::regex_match(value, m, date_re())) return false;
    const int year = std::atoi(m[1].str().c_str());
    const int month = std::atoi(m[2].str().c_str());
    const int day = std::atoi(m[3].str().c_str());
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    int max_day = days_in_month[month - 1];
    if (month == 2 && is_leap_year(year)) max_day = 29;
    return day <= max_day;
}

bool valid_clock_time(const std::string &value) {
    std::smatch m;
    if (!std::regex_match(value, m, time_re())) return false;
    const int hour = std::atoi(m[1].str().c_str());
    const int minute = std::atoi(m[2].str().c_str());
    const int second = std::atoi(m[3].str().c_str());
    return hour <= 23 && minute <= 59 && second <= 59;
}

bool valid_uri(const std::string &value) {
    if (std::regex_match(value, url_re())) return true;
    std::smatch m;
    if (!std::regex_match(value, m, scheme_re())) return false;
    const std::string rest = m[2].str();
    if (rest.rfind("//", 0) == 0) return rest.size() > 2;
    return !rest.empty();
}

bool valid_uri_reference(const std::string &value) {
    if (valid_uri(value)) return true;
    if (value.find_first_of(" \t\r\n") != std::string::npos) return false;
    return value.find(':') == std::string::npos || value.front() == '/';
}

FormatMap make_builtin() {
    FormatMap table;
    table["email"] = [](const std::string &v) {
        return v.find("..") == std::string::npos && std::regex_match(v, email_re());
    };
    table["url"] = [](const std::string &v) { return std::regex_match(v, url_re()); };
    table["uri"] = valid_uri;
    table["uri-reference"] = valid_uri_reference;
    table["uuid"] = [](const std::string &v) { return std::regex_match(v, uuid_re()); };
    table["date"] = valid_calendar_date;
    table["date-time"] = [](const std::string &v) {
        std::smatch m;
        if (!std::regex_match(v, m, date_time_re())) return false;
        return valid_calendar_date(m[1].str()) && valid_clock_time(m[2].str());
    };
    table["time"] = valid_clock_time;
    table["duration"] = [](const std::string &v) {
        // "P" and "PT" alone carry no component
        return v.size() > 1 && v.back() != 'T' && std::regex_match(v, duration_re());
    };
    table["ipv4"] = [](const std::string &v) { return std::regex_match(v, ipv4_re()); };
    table["ipv6"] = [](const std::string &v) {
        return std::regex_match(v, ipv6_re()) || v.find("::") != std::string::npos;
    };
    table["hostname"] = [](const std::string &v) {
        return !v.empty() && v.size() <= 253 && std::regex_match(v, hostname_re());
    };
    table["json-pointer"] = [](const std::string &v) { return std::regex_match(v, json_pointer_re()); };
    table["relative-json-pointer"] = [](const std::string &v) {
        return std::regex_match(v, relative_json_pointer_re());
    };
    table["iri"] = [](const std::string &v) { return std::regex_match(v, iri_re()); };
    table["iri-reference"] = [](const std::string &v) { return std::regex_match(v, iri_reference_re()); };
    table["uri-template"] = [](const std::string &v) { return std::regex_match(v, uri_template_re()); };
    table["regex"] = [](const std::string &v) {
        try {
            std::regex probe(v, std::regex_constants::ECMAScript);
            (void) probe;
            return true;
        } catch (const std::regex_error &) {
            return false;
        }
    };
    return table;
}

} // namespace

const FormatMap &builtin() {
    static const FormatMap table = make_builtin();
    return table;
}

bool is_known(const std::string &name) {
    return builtin().count(name) > 0;
}

bool check(const std::string &name, const std::string &value, const FormatMap *custom) {
    if (custom) {
        const auto it = custom->find(name);
        if (it != custom->end() && it->second) return it->second(value);
    }
    const auto &table = builtin();
    const auto it = table.find(name);
    if (it == table.end()) {
        LOG_VALIDATION_DEBUG("Unknown format '" << name << "', accepting value.");
        return true;
    }
    return it->second(value);
}

bool is_base64(const std::string &value) {
    return value.size() % 4 == 0 && std::regex_match(value, base64_re());
}

} // namespace qb::validation::formats
