#include "validation_exception.hpp"
#include "utilities.hpp"

namespace rulechain {

static std::string failure_message(const rule_ptr &failed_rule, const nlohmann::json &value)
{
  return "Rule " + failed_rule->id() + " failed for value " + format_argument(value);
}

validation_exception::validation_exception(rule_ptr failed_rule, nlohmann::json value)
    : std::runtime_error(failure_message(failed_rule, value))
    , rule_(std::move(failed_rule))
    , value_(std::move(value))
{
}

validation_exception::validation_exception(rule_ptr failed_rule, nlohmann::json value, std::exception_ptr fault)
    : std::runtime_error(failure_message(failed_rule, value))
    , rule_(std::move(failed_rule))
    , value_(std::move(value))
    , fault_(std::move(fault))
{
}

validation_exception::validation_exception(rule_ptr failed_rule, nlohmann::json value, std::vector<validation_exception> causes)
    : std::runtime_error(failure_message(failed_rule, value) + " (" + std::to_string(causes.size()) + " nested failures)")
    , rule_(std::move(failed_rule))
    , value_(std::move(value))
    , causes_(std::move(causes))
{
}

std::string validation_exception::fault_message() const
{
  if (!fault_)
    return {};
  try {
    std::rethrow_exception(fault_);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown fault";
  }
}

nested_validation_error::nested_validation_error(std::vector<validation_exception> failures)
    : std::runtime_error(std::to_string(failures.size()) + " nested validation failures")
    , failures_(std::move(failures))
{
}

validation_exception make_fault_exception(const rule_ptr &failed_rule, const nlohmann::json &value, std::exception_ptr fault)
{
  try {
    std::rethrow_exception(fault);
  } catch (const nested_validation_error &e) {
    return validation_exception(failed_rule, value, e.failures());
  } catch (...) {
    return validation_exception(failed_rule, value, std::current_exception());
  }
}

} // namespace rulechain
