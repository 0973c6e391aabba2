#pragma once

#include "rulechain.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulechain {

/**
 * @brief Maps rule names to the factories producing their predicates
 *
 * Built-in and custom rules share one namespace. Custom rules are consulted first so
 * they can shadow a built-in, and can be dropped again without touching the built-ins.
 * Rules already added to a validation keep their predicate after the registry changes.
 */
class predicate_registry {
public:
  typedef std::function<predicate(const rule_arguments &)> factory;
  typedef std::map<std::string, factory, std::less<>> factory_map;

  /** @brief Creates a registry holding the built-in rules and no custom rules */
  predicate_registry();

  /** @brief The process-wide registry used by default-constructed validations */
  static predicate_registry &global();

  /**
   * @brief Merges custom rules into the registry
   * @param rules Rule name to factory. An existing custom rule of the same name is replaced.
   */
  void extend(const factory_map &rules);
  void extend(std::string name, factory rule_factory);

  /** @brief Removes every custom rule */
  void clear_custom_rules();

  std::optional<factory> find(std::string_view name) const;
  bool contains(std::string_view name) const;
  bool is_builtin(std::string_view name) const;

  // Every visible rule name, sorted
  std::vector<std::string> names() const;

private:
  factory_map builtin_rules_;
  factory_map custom_rules_;
};

} // namespace rulechain
