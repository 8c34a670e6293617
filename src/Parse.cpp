/**
 * @file Parse.cpp
 * @brief Implementation of scalar typing
 */

#include "fieldpatch/Parse.hpp"
#include "fieldpatch/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace fieldpatch {

namespace {

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

} // namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    if (std::regex_match(str, integer_pattern())) {
        errno = 0;
        char* end = nullptr;
        const long long val = std::strtoll(str.c_str(), &end, 10);
        // Out of range integers stay strings
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return static_cast<std::int64_t>(val);
        }
    }

    if (std::regex_match(str, float_pattern())) {
        errno = 0;
        char* end = nullptr;
        const double val = std::strtod(str.c_str(), &end);
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return val;
        }
    }

    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

std::pair<std::string, Value> parse_assignment(const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw ConfigurationError("Expected key=value, got '" + assignment + "'");
    }
    std::string key = trim(assignment.substr(0, eq));
    if (key.empty()) {
        throw ConfigurationError("Empty key in assignment '" + assignment + "'");
    }
    return {std::move(key), parse_value(trim(assignment.substr(eq + 1)))};
}

} // namespace fieldpatch
