/**
 * @file Parse.hpp
 * @brief String-to-Value typing for environment variables and --set overrides
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case-insensitive)
 * - Null ("null", case-insensitive)
 * - Integer (^-?[0-9]+$, within int64 range)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...]) that parses
 * - Quoted string ("...") that parses as a JSON string
 * - Raw string (fallback)
 */

#ifndef FIELDPATCH_PARSE_HPP
#define FIELDPATCH_PARSE_HPP

#include "fieldpatch/Value.hpp"

#include <string>
#include <utility>

namespace fieldpatch {

/**
 * @brief Parse a string value to the matching JSON type
 *
 * Examples:
 * ```cpp
 * parse_value("true")        // → true
 * parse_value("30000")       // → 30000
 * parse_value("2.5")         // → 2.5
 * parse_value("[\"status\"]") // → ["status"]
 * parse_value("\"42\"")      // → "42"
 * parse_value("debug")       // → "debug"
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Split "key=value" and type the value with parse_value
 * @throws ConfigurationError when there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_assignment(const std::string& assignment);

} // namespace fieldpatch

#endif // FIELDPATCH_PARSE_HPP
