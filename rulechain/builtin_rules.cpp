#include "builtin_rules.hpp"
#include "validation.hpp"
#include "validation_exception.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <stdexcept>

namespace rulechain {

typedef std::function<bool(double, double)> numeric_comparison;

static void expect_arguments(std::string_view name, const rule_arguments &args, size_t min, size_t max)
{
  if (args.size() >= min && args.size() <= max)
    return;
  std::string expected = (min == max) ? std::to_string(min) : std::to_string(min) + " to " + std::to_string(max);
  throw std::invalid_argument("Rule '" + std::string(name) + "' expects " + expected + " arguments, got " + std::to_string(args.size()));
}

static predicate_registry::factory no_arguments(std::string name, simple_predicate test)
{
  return [name = std::move(name), test = std::move(test)](const rule_arguments &args) {
    expect_arguments(name, args, 0, 0);
    return predicate{ test, nullptr };
  };
}

static std::regex make_regex(const std::string &source, const std::string &flags)
{
  auto syntax = std::regex::ECMAScript;
  for (char flag: flags) {
    switch (flag) {
      case 'i':
        syntax |= std::regex::icase;
        break;
      case 'g':
        break;
      default:
        throw std::invalid_argument(std::string("Unsupported pattern flag '") + flag + "'");
    }
  }
  try {
    return std::regex(source, syntax);
  } catch (const std::regex_error &e) {
    throw std::invalid_argument("Invalid pattern '" + source + "': " + e.what());
  }
}

static simple_predicate matches(std::regex pattern)
{
  return [pattern = std::move(pattern)](const nlohmann::json &value) {
    return std::regex_search(to_display_string(value), pattern);
  };
}

static bool is_ascii_lower(char c)
{
  return c >= 'a' && c <= 'z';
}

static bool is_ascii_upper(char c)
{
  return c >= 'A' && c <= 'Z';
}

static bool is_ascii_letter(char c)
{
  return is_ascii_lower(c) || is_ascii_upper(c);
}

static bool is_ascii_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static bool is_vowel(char c)
{
  return std::string_view("aeiouAEIOU").find(c) != std::string_view::npos;
}

// Letters of one case, separated by any amount of whitespace, starting with a letter.
// Multi-byte code points never fall in the accepted ASCII sets.
static simple_predicate letter_words(bool (*is_letter)(char))
{
  return [is_letter](const nlohmann::json &value) {
    const std::string text = to_display_string(value);
    if (text.empty() || !is_letter(text.front()))
      return false;
    return std::all_of(text.begin(), text.end(), [is_letter](char c) { return is_letter(c) || is_ascii_space(c); });
  };
}

static simple_predicate vowels_only()
{
  return [](const nlohmann::json &value) {
    const std::string text = to_display_string(value);
    return !text.empty() && std::all_of(text.begin(), text.end(), is_vowel);
  };
}

static simple_predicate consonant_led_letters()
{
  return [](const nlohmann::json &value) {
    const std::string text = to_display_string(value);
    if (text.empty() || is_vowel(text.front()))
      return false;
    return std::all_of(text.begin(), text.end(), is_ascii_letter);
  };
}

static predicate_registry::factory comparison_rule(std::string name, numeric_comparison compare)
{
  return [name = std::move(name), compare = std::move(compare)](const rule_arguments &args) {
    expect_arguments(name, args, 1, 1);
    const double bound = to_number(args[0]);
    return predicate{ [compare, bound](const nlohmann::json &value) {
                       return compare(to_number(value), bound);
                     },
                      nullptr };
  };
}

static predicate_registry::factory interval_rule(std::string name)
{
  return [name = std::move(name)](const rule_arguments &args) {
    expect_arguments(name, args, 2, 2);
    const double min = to_number(args[0]);
    const double max = to_number(args[1]);
    return predicate{ [min, max](const nlohmann::json &value) {
                       const double number = to_number(value);
                       return number >= min && number <= max;
                     },
                      nullptr };
  };
}

static predicate_registry::factory length_rule(std::string name, bool check_min, bool check_max)
{
  return [name = std::move(name), check_min, check_max](const rule_arguments &args) {
    const size_t arity = (check_min && check_max) ? 2 : 1;
    expect_arguments(name, args, 1, arity);
    const double min = check_min ? to_number(args[0]) : 0;
    const double max = check_max ? to_number(args.back()) : 0;
    return predicate{ [min, max, check_min, check_max](const nlohmann::json &value) {
                       auto length = length_of(value);
                       if (!length.has_value())
                         return false;
                       const double l = static_cast<double>(length.value());
                       return (!check_min || l >= min) && (!check_max || l <= max);
                     },
                      nullptr };
  };
}

static nlohmann::json field_value(const nlohmann::json &value, const std::string &field)
{
  if (value.is_object()) {
    auto it = value.find(field);
    if (it != value.end())
      return *it;
  }
  return make_undefined();
}

predicate make_schema_predicate(schema_fields fields)
{
  auto shared_fields = std::make_shared<const schema_fields>(std::move(fields));

  predicate schema;
  schema.simple = [shared_fields](const nlohmann::json &value) {
    std::vector<validation_exception> failures;
    for (const auto &[field, field_validation]: *shared_fields) {
      for (auto &failure: field_validation.test_all(field_value(value, field))) {
        failure.set_target(field);
        failures.push_back(std::move(failure));
      }
    }
    if (!failures.empty())
      throw nested_validation_error(std::move(failures));
    return true;
  };

  schema.async = [shared_fields](const nlohmann::json &value) {
    return std::async(std::launch::deferred, [shared_fields, value]() {
      std::vector<validation_exception> failures;
      for (const auto &[field, field_validation]: *shared_fields) {
        try {
          field_validation.test_async(field_value(value, field)).get();
        } catch (validation_exception &failure) {
          failure.set_target(field);
          failures.push_back(std::move(failure));
        }
      }
      if (!failures.empty())
        throw nested_validation_error(std::move(failures));
      return true;
    });
  };

  return schema;
}

predicate_registry::factory_map builtin_rule_factories()
{
  predicate_registry::factory_map rules;

  // Kinds
  rules["string"]    = no_arguments("string", [](const nlohmann::json &value) { return value.is_string(); });
  rules["number"]    = no_arguments("number", [](const nlohmann::json &value) { return value.is_number(); });
  rules["boolean"]   = no_arguments("boolean", [](const nlohmann::json &value) { return value.is_boolean(); });
  rules["null"]      = no_arguments("null", [](const nlohmann::json &value) { return value.is_null(); });
  rules["undefined"] = no_arguments("undefined", [](const nlohmann::json &value) { return is_undefined(value); });
  rules["array"]     = no_arguments("array", [](const nlohmann::json &value) { return value.is_array(); });
  rules["object"]    = no_arguments("object", [](const nlohmann::json &value) { return value.is_object(); });
  rules["integer"]   = no_arguments("integer", [](const nlohmann::json &value) {
    if (value.is_number_integer() || value.is_number_unsigned())
      return true;
    if (!value.is_number_float())
      return false;
    const double number = value.get<double>();
    return std::isfinite(number) && std::trunc(number) == number;
  });

  rules["type"] = [](const rule_arguments &args) {
    expect_arguments("type", args, 1, 1);
    if (!args[0].is_string())
      throw std::invalid_argument("Rule 'type' expects a kind name");
    const std::string kind = args[0].get<std::string>();
    return predicate{ [kind](const nlohmann::json &value) {
                       if (is_undefined(value))
                         return kind == "undefined";
                       if (value.is_null() || value.is_structured())
                         return kind == "object";
                       if (value.is_boolean())
                         return kind == "boolean";
                       if (value.is_number())
                         return kind == "number";
                       return value.is_string() && kind == "string";
                     },
                      nullptr };
  };

  // Equality
  rules["equal"] = [](const rule_arguments &args) {
    expect_arguments("equal", args, 1, 1);
    return predicate{ [expected = args[0]](const nlohmann::json &value) { return loose_equal(value, expected); }, nullptr };
  };
  rules["exact"] = [](const rule_arguments &args) {
    expect_arguments("exact", args, 1, 1);
    return predicate{ [expected = args[0]](const nlohmann::json &value) { return strict_equal(value, expected); }, nullptr };
  };

  // Numbers
  rules["less_than"]             = comparison_rule("less_than", [](double v, double bound) { return v < bound; });
  rules["less_than_or_equal"]    = comparison_rule("less_than_or_equal", [](double v, double bound) { return v <= bound; });
  rules["greater_than"]          = comparison_rule("greater_than", [](double v, double bound) { return v > bound; });
  rules["greater_than_or_equal"] = comparison_rule("greater_than_or_equal", [](double v, double bound) { return v >= bound; });
  rules["between"]               = interval_rule("between");
  rules["range"]                 = interval_rule("range");
  rules["negative"]              = no_arguments("negative", [](const nlohmann::json &value) { return to_number(value) < 0; });
  rules["positive"]              = no_arguments("positive", [](const nlohmann::json &value) { return to_number(value) >= 0; });
  rules["even"]                  = no_arguments("even", [](const nlohmann::json &value) { return std::fmod(to_number(value), 2.0) == 0; });
  rules["odd"]                   = no_arguments("odd", [](const nlohmann::json &value) { return std::fabs(std::fmod(to_number(value), 2.0)) == 1; });

  // Text
  rules["pattern"] = [](const rule_arguments &args) {
    expect_arguments("pattern", args, 1, 2);
    if (!args[0].is_string() || (args.size() == 2 && !args[1].is_string()))
      throw std::invalid_argument("Rule 'pattern' expects a pattern source and optional flags");
    const std::string flags = args.size() == 2 ? args[1].get<std::string>() : "";
    return predicate{ matches(make_regex(args[0].get<std::string>(), flags)), nullptr };
  };
  rules["lowercase"] = no_arguments("lowercase", letter_words(is_ascii_lower));
  rules["uppercase"] = no_arguments("uppercase", letter_words(is_ascii_upper));
  rules["vowel"]     = no_arguments("vowel", vowels_only());
  rules["consonant"] = no_arguments("consonant", consonant_led_letters());

  // Sequences
  rules["first"] = [](const rule_arguments &args) {
    expect_arguments("first", args, 1, 1);
    return predicate{ [expected = args[0]](const nlohmann::json &value) { return loose_equal(element_at(value, 0), expected); }, nullptr };
  };
  rules["last"] = [](const rule_arguments &args) {
    expect_arguments("last", args, 1, 1);
    return predicate{ [expected = args[0]](const nlohmann::json &value) {
                       auto length = length_of(value);
                       if (!length.has_value() || length.value() == 0)
                         return loose_equal(make_undefined(), expected);
                       return loose_equal(element_at(value, length.value() - 1), expected);
                     },
                      nullptr };
  };
  rules["empty"] = no_arguments("empty", [](const nlohmann::json &value) {
    auto length = length_of(value);
    return length.has_value() && length.value() == 0;
  });
  rules["length"]     = length_rule("length", true, true);
  rules["min_length"] = length_rule("min_length", true, false);
  rules["max_length"] = length_rule("max_length", false, true);
  rules["includes"]   = [](const rule_arguments &args) {
    expect_arguments("includes", args, 1, 1);
    return predicate{ [expected = args[0]](const nlohmann::json &value) {
                       if (value.is_array())
                         return std::any_of(value.begin(), value.end(), [&expected](const nlohmann::json &element) {
                           return strict_equal(element, expected);
                         });
                       if (value.is_string())
                         return value.get_ref<const std::string &>().find(to_display_string(expected)) != std::string::npos;
                       throw std::invalid_argument("Value " + format_argument(value) + " does not support includes");
                     },
                      nullptr };
  };

  spdlog::trace("Registered {} built-in rules", rules.size());
  return rules;
}

} // namespace rulechain
