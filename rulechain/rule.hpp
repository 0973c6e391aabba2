#pragma once

#include "rulechain.hpp"
#include "modifier.hpp"
#include <exception>
#include <expected>
#include <string>

namespace rulechain {

/**
 * @brief One named, parameterized and fully composed predicate step of a chain
 *
 * Rules are immutable once built and shared between every validation that contains them.
 */
class rule {
public:
  rule(std::string name, rule_arguments args, modifier_list modifiers, const predicate &base);

  const std::string &name() const
  {
    return name_;
  }
  const rule_arguments &args() const
  {
    return args_;
  }
  const modifier_list &modifiers() const
  {
    return modifiers_;
  }
  bool fault_verdict() const
  {
    return fault_verdict_;
  }

  // e.g. not.every.lowercase() or length(3, 5)
  std::string id() const;

  /**
   * @brief Runs the composed predicate synchronously
   * @return The boolean outcome, or the fault raised by the predicate when the
   *         modifiers do not turn a fault into a pass
   */
  std::expected<bool, std::exception_ptr> evaluate(const nlohmann::json &value) const;

  /**
   * @brief Runs the composed asynchronous predicate
   *
   * Nothing is started until the returned future is waited on. A fault that the
   * modifiers do not turn into a pass is rethrown from get().
   */
  std::future<bool> evaluate_async(const nlohmann::json &value) const;

private:
  std::string name_;
  rule_arguments args_;
  modifier_list modifiers_;
  simple_predicate test_;
  async_predicate test_async_;
  bool fault_verdict_;
};

} // namespace rulechain
