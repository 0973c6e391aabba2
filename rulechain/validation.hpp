#pragma once

#include "rulechain.hpp"
#include "rule.hpp"
#include "modifier.hpp"
#include "predicate_registry.hpp"
#include "validation_exception.hpp"
#include <future>
#include <string>
#include <string_view>
#include <vector>

namespace rulechain {

/**
 * @brief An immutable chain of rules and the entry point of the fluent API
 *
 * Every builder call returns a new validation and leaves the receiver untouched, so
 * two validations can share a common prefix and diverge afterwards:
 *
 *   auto a = rulechain::validation().number();
 *   auto b = a.not_().equal(10);   // a still only checks number()
 *
 * Modifiers (not_, some, every) are held as pending until the next rule is added.
 */
class validation {
public:
  /** @brief An empty chain resolving rule names through the process-wide registry */
  validation();

  /** @brief An empty chain resolving rule names through the given registry, which must outlive the building calls */
  explicit validation(const predicate_registry &registry);

  /**
   * @brief Queues a modifier for the next rule
   * @throws std::out_of_range if no modifier has that name
   */
  validation with_modifier(std::string_view name) const;
  validation with_modifier(modifier_ptr pending) const;

  /**
   * @brief Appends a rule resolved through the registry, composed with the pending modifiers
   * @throws std::out_of_range if the registry has no such rule
   * @throws std::invalid_argument if the rule factory rejects the arguments
   */
  validation with_rule(std::string_view name, rule_arguments args = {}) const;

  /** @brief Appends a rule built from an explicit predicate, composed with the pending modifiers */
  validation with_predicate(std::string name, rule_arguments args, const predicate &base) const;

  // Generic form for custom rules: apply("my_rule", "abc", 3)
  template <typename... Args>
  validation apply(std::string_view name, Args &&...args) const
  {
    return with_rule(name, rule_arguments{ nlohmann::json(std::forward<Args>(args))... });
  }

  // Modifiers
  validation not_() const
  {
    return with_modifier("not");
  }
  validation some() const
  {
    return with_modifier("some");
  }
  validation every() const
  {
    return with_modifier("every");
  }

  // Kind checks
  validation string() const;
  validation number() const;
  validation boolean() const;
  validation null() const;
  validation undefined() const;
  validation array() const;
  validation object() const;
  validation integer() const;
  validation type(const std::string &kind) const;

  // Comparisons
  validation equal(const nlohmann::json &expected) const;
  validation exact(const nlohmann::json &expected) const;
  validation less_than(const nlohmann::json &bound) const;
  validation less_than_or_equal(const nlohmann::json &bound) const;
  validation greater_than(const nlohmann::json &bound) const;
  validation greater_than_or_equal(const nlohmann::json &bound) const;
  validation between(const nlohmann::json &min, const nlohmann::json &max) const;
  validation range(const nlohmann::json &min, const nlohmann::json &max) const;
  validation negative() const;
  validation positive() const;
  validation even() const;
  validation odd() const;

  // Strings and sequences
  validation pattern(const std::string &source, const std::string &flags = "") const;
  validation lowercase() const;
  validation uppercase() const;
  validation vowel() const;
  validation consonant() const;
  validation first(const nlohmann::json &expected) const;
  validation last(const nlohmann::json &expected) const;
  validation empty() const;
  validation length(const nlohmann::json &exact) const;
  validation length(const nlohmann::json &min, const nlohmann::json &max) const;
  validation min_length(const nlohmann::json &min) const;
  validation max_length(const nlohmann::json &max) const;
  validation includes(const nlohmann::json &expected) const;

  /**
   * @brief Validates an object field by field
   *
   * Each field validation is run with test_all against the field value (undefined when
   * missing). Failures are reported as one exception whose causes are the field failures,
   * each carrying the field name as target.
   */
  validation schema(schema_fields fields) const;

  // Execution
  bool test(const nlohmann::json &value) const;
  void check(const nlohmann::json &value) const;
  std::vector<validation_exception> test_all(const nlohmann::json &value) const;
  std::future<nlohmann::json> test_async(nlohmann::json value) const;

  // Introspection
  const rule_list &rules() const
  {
    return rules_;
  }
  const modifier_list &pending_modifiers() const
  {
    return pending_modifiers_;
  }
  std::vector<std::string> rule_ids() const;
  bool empty_chain() const
  {
    return rules_.empty();
  }

private:
  void require_finalized() const;

  const predicate_registry *registry_;
  rule_list rules_;
  modifier_list pending_modifiers_;
};

} // namespace rulechain
