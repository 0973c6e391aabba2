#pragma once

#include "rulechain.hpp"
#include "rule.hpp"
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rulechain {

/**
 * @brief Raised when a rule of a chain is not satisfied by a value
 *
 * The cause is either the fault raised by the predicate, or the list of failures
 * reported by a nested (schema) validation, or absent for a plain false result.
 */
class validation_exception : public std::runtime_error {
public:
  validation_exception(rule_ptr failed_rule, nlohmann::json value);
  validation_exception(rule_ptr failed_rule, nlohmann::json value, std::exception_ptr fault);
  validation_exception(rule_ptr failed_rule, nlohmann::json value, std::vector<validation_exception> causes);

  const rule &failed_rule() const
  {
    return *rule_;
  }
  const rule_ptr &failed_rule_ptr() const
  {
    return rule_;
  }
  const nlohmann::json &value() const
  {
    return value_;
  }
  std::exception_ptr fault() const
  {
    return fault_;
  }
  const std::vector<validation_exception> &causes() const
  {
    return causes_;
  }
  const std::optional<std::string> &target() const
  {
    return target_;
  }

  bool has_cause() const
  {
    return fault_ != nullptr || !causes_.empty();
  }

  // Message of the fault, empty when there is none
  std::string fault_message() const;

  void set_target(std::string target)
  {
    target_ = std::move(target);
  }

private:
  rule_ptr rule_;
  nlohmann::json value_;
  std::exception_ptr fault_;
  std::vector<validation_exception> causes_;
  std::optional<std::string> target_;
};

/**
 * @brief Raised by a predicate that runs nested validations, carrying their failures
 */
class nested_validation_error : public std::runtime_error {
public:
  explicit nested_validation_error(std::vector<validation_exception> failures);

  const std::vector<validation_exception> &failures() const
  {
    return failures_;
  }

private:
  std::vector<validation_exception> failures_;
};

/**
 * @brief Builds the exception for a rule whose predicate faulted
 *
 * A nested_validation_error becomes the list of causes; any other fault is kept as is.
 */
validation_exception make_fault_exception(const rule_ptr &failed_rule, const nlohmann::json &value, std::exception_ptr fault);

} // namespace rulechain
