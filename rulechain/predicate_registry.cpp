#include "predicate_registry.hpp"
#include "builtin_rules.hpp"
#include "spdlog/spdlog.h"
#include <set>

namespace rulechain {

predicate_registry::predicate_registry() : builtin_rules_(builtin_rule_factories())
{
}

predicate_registry &predicate_registry::global()
{
  static predicate_registry registry;
  return registry;
}

void predicate_registry::extend(const factory_map &rules)
{
  for (const auto &i: rules)
    extend(i.first, i.second);
}

void predicate_registry::extend(std::string name, factory rule_factory)
{
  if (builtin_rules_.contains(name))
    spdlog::debug("Custom rule '{}' shadows a built-in rule", name);
  else
    spdlog::debug("Registering custom rule '{}'", name);
  custom_rules_.insert_or_assign(std::move(name), std::move(rule_factory));
}

void predicate_registry::clear_custom_rules()
{
  spdlog::debug("Clearing {} custom rules", custom_rules_.size());
  custom_rules_.clear();
}

std::optional<predicate_registry::factory> predicate_registry::find(std::string_view name) const
{
  auto custom = custom_rules_.find(name);
  if (custom != custom_rules_.end())
    return custom->second;

  auto builtin = builtin_rules_.find(name);
  if (builtin != builtin_rules_.end())
    return builtin->second;

  return std::nullopt;
}

bool predicate_registry::contains(std::string_view name) const
{
  return custom_rules_.find(name) != custom_rules_.end() || builtin_rules_.find(name) != builtin_rules_.end();
}

bool predicate_registry::is_builtin(std::string_view name) const
{
  return builtin_rules_.find(name) != builtin_rules_.end();
}

std::vector<std::string> predicate_registry::names() const
{
  std::set<std::string> unique;
  for (const auto &i: builtin_rules_)
    unique.insert(i.first);
  for (const auto &i: custom_rules_)
    unique.insert(i.first);
  return { unique.begin(), unique.end() };
}

} // namespace rulechain
