#pragma once

#include "rulechain.hpp"
#include "yaml-cpp/yaml.h"
#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rulechain {

// The absent value. Stored as a discarded json so it never equals null.
nlohmann::json make_undefined();
bool is_undefined(const nlohmann::json &value);

std::string to_display_string(const nlohmann::json &value);
std::string format_argument(const nlohmann::json &value);
double to_number(const nlohmann::json &value);

bool loose_equal(const nlohmann::json &left, const nlohmann::json &right);
bool strict_equal(const nlohmann::json &left, const nlohmann::json &right);

/**
 * @brief Splits a value into the elements a quantifier iterates over
 * @return Array elements, string characters (one UTF-8 code point each) or nothing for other kinds
 */
std::optional<std::vector<nlohmann::json>> as_sequence(const nlohmann::json &value);

/**
 * @brief Length of a string (in code points) or array
 * @throws std::invalid_argument when the value is null or undefined
 * @return Nothing when the value kind has no length
 */
std::optional<size_t> length_of(const nlohmann::json &value);

// Element or character at index, undefined when out of range. Throws for null/undefined.
nlohmann::json element_at(const nlohmann::json &value, size_t index);

nlohmann::json yaml_to_json(const YAML::Node &node);

template <class CharContainer>
static std::expected<size_t, std::error_code> get_file_contents(std::filesystem::path filename, CharContainer *container)
{
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto file_size = file.tellg();
  if (file_size < 0) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  container->resize(static_cast<typename CharContainer::size_type>(file_size));

  file.seekg(0);
  if (!file.read(reinterpret_cast<char *>(container->data()), file_size)) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  return container->size();
}

template <class CharContainer>
static std::expected<CharContainer, std::error_code> get_file_contents(std::filesystem::path filename)
{
  CharContainer cc;
  auto result = get_file_contents(filename, &cc);
  if (result) {
    return cc;
  }
  return std::unexpected(result.error());
}

} // namespace rulechain
