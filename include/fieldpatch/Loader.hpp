/**
 * @file Loader.hpp
 * @brief Reading and writing JSON / TOML documents
 *
 * Used for engine configuration, patch payloads, object files and
 * persisted binding state.
 *
 * Format is chosen by file extension:
 * - ".json" parsed with nlohmann::json
 * - ".toml" parsed with toml++ and converted to Value
 */

#ifndef FIELDPATCH_LOADER_HPP
#define FIELDPATCH_LOADER_HPP

#include "fieldpatch/Value.hpp"

#include <optional>
#include <string>

namespace fieldpatch {

// ============================================================================
// Text parsing
// ============================================================================

/**
 * @brief Parse JSON text
 * @param text Input text
 * @param source Label used in error messages
 * @throws ParseError on malformed input
 */
Value parse_json_text(const std::string& text, const std::string& source);

/**
 * @brief Parse TOML text into a Value object
 *
 * Dates and times become their TOML string form.
 *
 * @throws ParseError with line/column on malformed input
 */
Value parse_toml_text(const std::string& text, const std::string& source);

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Read a whole file
 * @throws FileNotFoundError if the file does not exist
 */
std::string read_text_file(const std::string& path);

Value load_json_file(const std::string& path);
Value load_toml_file(const std::string& path);

/**
 * @brief Load by extension
 *
 * An empty path yields an empty object.
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws ParseError on malformed content
 * @throws ConfigurationError for an unsupported extension
 */
Value load_document_file(const std::string& path);

/**
 * @brief Write a document as pretty-printed JSON
 *
 * Writes to "<path>.tmp" first and renames over the target.
 *
 * @throws ConfigurationError if the file cannot be written
 */
void save_json_file(const std::string& path, const Value& doc);

/**
 * @brief Lowercased extension including the dot (".json")
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Read an environment variable
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace fieldpatch

#endif // FIELDPATCH_LOADER_HPP
