#include "utilities.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace rulechain {

static bool is_continuation_byte(char c)
{
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

static std::vector<std::string> split_code_points(const std::string &text)
{
  std::vector<std::string> characters;
  for (size_t i = 0; i < text.size();) {
    size_t end = i + 1;
    while (end < text.size() && is_continuation_byte(text[end]))
      ++end;
    characters.push_back(text.substr(i, end - i));
    i = end;
  }
  return characters;
}

// Integers below 2^53 print exactly. Everything else uses the shortest round-trip digits laid out
// in plain notation up to 21 integer digits and down to 6 leading zeros, exponent notation beyond.
static std::string format_number(double number)
{
  if (std::isnan(number))
    return "NaN";
  if (std::isinf(number))
    return number > 0 ? "Infinity" : "-Infinity";
  if (number == 0)
    return "0";
  if (std::trunc(number) == number && std::fabs(number) < 9007199254740992.0)
    return std::to_string(static_cast<int64_t>(number));

  char buffer[64];
  auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), std::fabs(number), std::chars_format::scientific);
  if (ec != std::errc())
    return nlohmann::json(number).dump();

  const std::string scientific(buffer, ptr);
  const auto exponent_position = scientific.find('e');
  std::string digits           = scientific.substr(0, exponent_position);
  digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
  const int exponent = std::stoi(scientific.substr(exponent_position + 1));

  const int k = static_cast<int>(digits.size());
  const int n = exponent + 1;
  std::string s = number < 0 ? "-" : "";
  if (k <= n && n <= 21) {
    s += digits + std::string(static_cast<size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    s += digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
  } else if (-6 < n && n <= 0) {
    s += "0." + std::string(static_cast<size_t>(-n), '0') + digits;
  } else {
    s += digits.substr(0, 1);
    if (k > 1)
      s += "." + digits.substr(1);
    s += (n - 1 < 0) ? "e-" : "e+";
    s += std::to_string(std::abs(n - 1));
  }
  return s;
}

nlohmann::json make_undefined()
{
  return nlohmann::json(nlohmann::json::value_t::discarded);
}

bool is_undefined(const nlohmann::json &value)
{
  return value.is_discarded();
}

std::string to_display_string(const nlohmann::json &value)
{
  switch (value.type()) {
    case nlohmann::json::value_t::string:
      return value.get_ref<const std::string &>();
    case nlohmann::json::value_t::boolean:
      return value.get<bool>() ? "true" : "false";
    case nlohmann::json::value_t::null:
      return "null";
    case nlohmann::json::value_t::discarded:
      return "undefined";
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
      return value.dump();
    case nlohmann::json::value_t::number_float:
      return format_number(value.get<double>());
    case nlohmann::json::value_t::array: {
      std::string s;
      for (size_t i = 0; i < value.size(); ++i) {
        if (i != 0)
          s += ",";
        // Nested null/undefined elements render empty
        if (!value[i].is_null() && !is_undefined(value[i]))
          s += to_display_string(value[i]);
      }
      return s;
    }
    case nlohmann::json::value_t::object:
      return "[object Object]";
    default:
      return value.dump();
  }
}

std::string format_argument(const nlohmann::json &value)
{
  if (is_undefined(value))
    return "undefined";
  if (value.is_number_float())
    return format_number(value.get<double>());
  return value.dump();
}

double to_number(const nlohmann::json &value)
{
  constexpr double nan = std::numeric_limits<double>::quiet_NaN();

  switch (value.type()) {
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
      return value.get<double>();
    case nlohmann::json::value_t::boolean:
      return value.get<bool>() ? 1.0 : 0.0;
    case nlohmann::json::value_t::null:
      return 0.0;
    case nlohmann::json::value_t::string: {
      const auto &text   = value.get_ref<const std::string &>();
      const auto first   = text.find_first_not_of(" \t\r\n\f\v");
      if (first == std::string::npos)
        return 0.0;
      const auto last    = text.find_last_not_of(" \t\r\n\f\v");
      std::string trimmed = text.substr(first, last - first + 1);
      if (trimmed == "Infinity" || trimmed == "+Infinity")
        return std::numeric_limits<double>::infinity();
      if (trimmed == "-Infinity")
        return -std::numeric_limits<double>::infinity();
      const char *begin = trimmed.data();
      const char *end   = trimmed.data() + trimmed.size();
      if (*begin == '+')
        ++begin;
      double number   = 0;
      auto [ptr, ec]  = std::from_chars(begin, end, number);
      if (ec != std::errc() || ptr != end || !std::isfinite(number))
        return nan;
      return number;
    }
    case nlohmann::json::value_t::array:
      if (value.empty())
        return 0.0;
      if (value.size() == 1)
        return to_number(nlohmann::json(to_display_string(value[0])));
      return nan;
    default:
      return nan;
  }
}

bool loose_equal(const nlohmann::json &left, const nlohmann::json &right)
{
  const bool left_nullish  = left.is_null() || is_undefined(left);
  const bool right_nullish = right.is_null() || is_undefined(right);
  if (left_nullish || right_nullish)
    return left_nullish && right_nullish;

  if (left.is_boolean())
    return loose_equal(nlohmann::json(left.get<bool>() ? 1 : 0), right);
  if (right.is_boolean())
    return loose_equal(left, nlohmann::json(right.get<bool>() ? 1 : 0));

  if (left.is_string() && right.is_string())
    return left.get_ref<const std::string &>() == right.get_ref<const std::string &>();
  if (left.is_primitive() && right.is_primitive())
    return to_number(left) == to_number(right);

  if (left.is_structured() && right.is_structured())
    return left == right;

  if (left.is_structured())
    return loose_equal(nlohmann::json(to_display_string(left)), right);
  return loose_equal(left, nlohmann::json(to_display_string(right)));
}

bool strict_equal(const nlohmann::json &left, const nlohmann::json &right)
{
  if (is_undefined(left) || is_undefined(right))
    return is_undefined(left) && is_undefined(right);
  if (left.is_number() && right.is_number())
    return to_number(left) == to_number(right);
  if (left.type() != right.type())
    return false;
  return left == right;
}

std::optional<std::vector<nlohmann::json>> as_sequence(const nlohmann::json &value)
{
  if (value.is_array())
    return std::vector<nlohmann::json>(value.begin(), value.end());

  if (value.is_string()) {
    std::vector<nlohmann::json> characters;
    for (auto &c: split_code_points(value.get_ref<const std::string &>()))
      characters.emplace_back(std::move(c));
    return characters;
  }

  return std::nullopt;
}

std::optional<size_t> length_of(const nlohmann::json &value)
{
  if (value.is_null() || is_undefined(value))
    throw std::invalid_argument("Cannot read length of " + to_display_string(value));

  if (value.is_array())
    return value.size();

  if (value.is_string()) {
    const auto &text = value.get_ref<const std::string &>();
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
      return !is_continuation_byte(c);
    }));
  }

  return std::nullopt;
}

nlohmann::json element_at(const nlohmann::json &value, size_t index)
{
  if (value.is_null() || is_undefined(value))
    throw std::invalid_argument("Cannot read index " + std::to_string(index) + " of " + to_display_string(value));

  if (value.is_array())
    return index < value.size() ? value[index] : make_undefined();

  if (value.is_string()) {
    auto characters = split_code_points(value.get_ref<const std::string &>());
    return index < characters.size() ? nlohmann::json(characters[index]) : make_undefined();
  }

  return make_undefined();
}

nlohmann::json yaml_to_json(const YAML::Node &node)
{
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;

    case YAML::NodeType::Scalar: {
      const auto &text = node.Scalar();
      // Quoted scalars keep their string type
      if (node.Tag() == "!")
        return text;
      if (text == "true" || text == "True" || text == "TRUE")
        return true;
      if (text == "false" || text == "False" || text == "FALSE")
        return false;
      if (text == "null" || text == "Null" || text == "NULL" || text == "~")
        return nullptr;

      const char *begin = text.data();
      const char *end   = text.data() + text.size();

      int64_t integer = 0;
      auto int_result = std::from_chars(begin, end, integer);
      if (int_result.ec == std::errc() && int_result.ptr == end)
        return integer;

      double number   = 0;
      auto fp_result  = std::from_chars(begin, end, number);
      if (fp_result.ec == std::errc() && fp_result.ptr == end && std::isfinite(number))
        return number;

      return text;
    }

    case YAML::NodeType::Sequence: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto &item: node)
        array.push_back(yaml_to_json(item));
      return array;
    }

    case YAML::NodeType::Map: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto &item: node)
        object[item.first.as<std::string>()] = yaml_to_json(item.second);
      return object;
    }

    default:
      return make_undefined();
  }
}

} // namespace rulechain
