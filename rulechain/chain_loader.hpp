#pragma once

#include "validation.hpp"
#include "yaml-cpp/yaml.h"
#include <expected>
#include <filesystem>
#include <map>
#include <string>

namespace rulechain {

typedef std::map<std::string, validation> validation_map;

/**
 * @brief Builds a validation from a YAML sequence of steps
 * @param node Sequence where each step is "mod.mod.rule" or { "mod.mod.rule": args }
 * @param registry Registry resolving the rule names
 * @return The validation or a message describing the first malformed step
 *
 * Args are a scalar (single argument) or a sequence (argument list). The schema rule
 * takes a map of field name to a nested step sequence.
 */
std::expected<validation, std::string> parse_chain(const YAML::Node &node, const predicate_registry &registry = predicate_registry::global());

/**
 * @brief Parses every entry under the top-level "validations" map
 */
std::expected<validation_map, std::string> parse_validations(const YAML::Node &document, const predicate_registry &registry = predicate_registry::global());

/**
 * @brief Loads a YAML rules file
 */
std::expected<validation_map, std::string> load_validations(const std::filesystem::path &file_path, const predicate_registry &registry = predicate_registry::global());

/**
 * @brief Loads a document to validate from a JSON file, or a YAML file when the extension is .yaml/.yml
 */
std::expected<nlohmann::json, std::string> load_document(const std::filesystem::path &file_path);

} // namespace rulechain
