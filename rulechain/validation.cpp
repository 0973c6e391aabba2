#include "validation.hpp"
#include "builtin_rules.hpp"
#include "executor.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace rulechain {

validation::validation() : registry_(&predicate_registry::global())
{
}

validation::validation(const predicate_registry &registry) : registry_(&registry)
{
}

validation validation::with_modifier(std::string_view name) const
{
  auto found = modifier::find(name);
  if (!found)
    throw std::out_of_range("Unknown modifier '" + std::string(name) + "'");
  return with_modifier(std::move(found));
}

validation validation::with_modifier(modifier_ptr pending) const
{
  validation next = *this;
  next.pending_modifiers_.push_back(std::move(pending));
  return next;
}

validation validation::with_rule(std::string_view name, rule_arguments args) const
{
  auto rule_factory = registry_->find(name);
  if (!rule_factory.has_value())
    throw std::out_of_range("Unknown rule '" + std::string(name) + "'");

  predicate base = rule_factory.value()(args);
  return with_predicate(std::string(name), std::move(args), base);
}

validation validation::with_predicate(std::string name, rule_arguments args, const predicate &base) const
{
  if (!base.has_simple() && !base.has_async())
    throw std::invalid_argument("Rule '" + name + "' has no predicate");

  validation next = *this;
  next.rules_.push_back(std::make_shared<const rule>(std::move(name), std::move(args), pending_modifiers_, base));
  next.pending_modifiers_.clear();
  spdlog::trace("Chained {}", next.rules_.back()->id());
  return next;
}

validation validation::string() const
{
  return with_rule("string");
}

validation validation::number() const
{
  return with_rule("number");
}

validation validation::boolean() const
{
  return with_rule("boolean");
}

validation validation::null() const
{
  return with_rule("null");
}

validation validation::undefined() const
{
  return with_rule("undefined");
}

validation validation::array() const
{
  return with_rule("array");
}

validation validation::object() const
{
  return with_rule("object");
}

validation validation::integer() const
{
  return with_rule("integer");
}

validation validation::type(const std::string &kind) const
{
  return with_rule("type", { kind });
}

validation validation::equal(const nlohmann::json &expected) const
{
  return with_rule("equal", { expected });
}

validation validation::exact(const nlohmann::json &expected) const
{
  return with_rule("exact", { expected });
}

validation validation::less_than(const nlohmann::json &bound) const
{
  return with_rule("less_than", { bound });
}

validation validation::less_than_or_equal(const nlohmann::json &bound) const
{
  return with_rule("less_than_or_equal", { bound });
}

validation validation::greater_than(const nlohmann::json &bound) const
{
  return with_rule("greater_than", { bound });
}

validation validation::greater_than_or_equal(const nlohmann::json &bound) const
{
  return with_rule("greater_than_or_equal", { bound });
}

validation validation::between(const nlohmann::json &min, const nlohmann::json &max) const
{
  return with_rule("between", { min, max });
}

validation validation::range(const nlohmann::json &min, const nlohmann::json &max) const
{
  return with_rule("range", { min, max });
}

validation validation::negative() const
{
  return with_rule("negative");
}

validation validation::positive() const
{
  return with_rule("positive");
}

validation validation::even() const
{
  return with_rule("even");
}

validation validation::odd() const
{
  return with_rule("odd");
}

validation validation::pattern(const std::string &source, const std::string &flags) const
{
  if (flags.empty())
    return with_rule("pattern", { source });
  return with_rule("pattern", { source, flags });
}

validation validation::lowercase() const
{
  return with_rule("lowercase");
}

validation validation::uppercase() const
{
  return with_rule("uppercase");
}

validation validation::vowel() const
{
  return with_rule("vowel");
}

validation validation::consonant() const
{
  return with_rule("consonant");
}

validation validation::first(const nlohmann::json &expected) const
{
  return with_rule("first", { expected });
}

validation validation::last(const nlohmann::json &expected) const
{
  return with_rule("last", { expected });
}

validation validation::empty() const
{
  return with_rule("empty");
}

validation validation::length(const nlohmann::json &exact) const
{
  return with_rule("length", { exact });
}

validation validation::length(const nlohmann::json &min, const nlohmann::json &max) const
{
  return with_rule("length", { min, max });
}

validation validation::min_length(const nlohmann::json &min) const
{
  return with_rule("min_length", { min });
}

validation validation::max_length(const nlohmann::json &max) const
{
  return with_rule("max_length", { max });
}

validation validation::includes(const nlohmann::json &expected) const
{
  return with_rule("includes", { expected });
}

validation validation::schema(schema_fields fields) const
{
  nlohmann::json description = nlohmann::json::object();
  for (const auto &[field, field_validation]: fields)
    description[field] = field_validation.rule_ids();

  return with_predicate("schema", { description }, make_schema_predicate(std::move(fields)));
}

void validation::require_finalized() const
{
  if (!pending_modifiers_.empty())
    throw std::logic_error("Validation has " + std::to_string(pending_modifiers_.size()) + " modifiers not followed by a rule");
}

bool validation::test(const nlohmann::json &value) const
{
  require_finalized();
  return run_test(rules_, value);
}

void validation::check(const nlohmann::json &value) const
{
  require_finalized();
  run_check(rules_, value);
}

std::vector<validation_exception> validation::test_all(const nlohmann::json &value) const
{
  require_finalized();
  return run_test_all(rules_, value);
}

std::future<nlohmann::json> validation::test_async(nlohmann::json value) const
{
  require_finalized();
  return run_test_async(rules_, std::move(value));
}

std::vector<std::string> validation::rule_ids() const
{
  std::vector<std::string> ids;
  for (const auto &r: rules_)
    ids.push_back(r->id());
  return ids;
}

} // namespace rulechain
