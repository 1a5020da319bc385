#ifndef JSON_FILE_HPP
#define JSON_FILE_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

// JSON documents are parsed and produced with yaml-cpp: YAML 1.2 accepts JSON as input,
// and a flow-style emitter with double-quoted strings writes JSON back.

/**
 * @brief Parses a JSON file.
 * @return The document root, or an error if the file is missing or malformed.
 */
std::expected<YAML::Node, std::string> read_json_file(const std::filesystem::path& path);

/**
 * @brief Applies flow style, JSON string escaping and lowercase null to an emitter.
 */
void configure_json_emitter(YAML::Emitter& out);

/**
 * @brief Emits a parsed node as JSON. Quoted scalars are written as strings and plain
 * scalars (numbers, booleans) verbatim.
 */
void emit_json_value(YAML::Emitter& out, const YAML::Node& node);

/**
 * @brief Writes text to a file, creating parent directories.
 */
std::expected<void, std::string> write_text_file(const std::filesystem::path& path, std::string_view text);

#endif
