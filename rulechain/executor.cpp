#include "executor.hpp"
#include "rule.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace rulechain {

bool run_test(const rule_list &rules, const nlohmann::json &value)
{
  for (const auto &r: rules) {
    auto outcome = r->evaluate(value);
    if (!outcome.has_value() || !outcome.value()) {
      spdlog::trace("{} not satisfied by {}", r->id(), format_argument(value));
      return false;
    }
  }
  return true;
}

void run_check(const rule_list &rules, const nlohmann::json &value)
{
  for (const auto &r: rules) {
    auto outcome = r->evaluate(value);
    if (!outcome.has_value())
      throw make_fault_exception(r, value, outcome.error());
    if (!outcome.value())
      throw validation_exception(r, value);
  }
}

std::vector<validation_exception> run_test_all(const rule_list &rules, const nlohmann::json &value)
{
  std::vector<validation_exception> failures;
  for (const auto &r: rules) {
    auto outcome = r->evaluate(value);
    if (!outcome.has_value())
      failures.push_back(make_fault_exception(r, value, outcome.error()));
    else if (!outcome.value())
      failures.emplace_back(r, value);
  }
  spdlog::trace("{} of {} rules failed for {}", failures.size(), rules.size(), format_argument(value));
  return failures;
}

std::future<nlohmann::json> run_test_async(rule_list rules, nlohmann::json value)
{
  return std::async(std::launch::async, [rules = std::move(rules), value = std::move(value)]() {
    for (const auto &r: rules) {
      bool passed = false;
      try {
        passed = r->evaluate_async(value).get();
      } catch (...) {
        spdlog::trace("{} faulted asynchronously for {}", r->id(), format_argument(value));
        throw make_fault_exception(r, value, std::current_exception());
      }
      if (!passed) {
        spdlog::trace("{} not satisfied by {}", r->id(), format_argument(value));
        throw validation_exception(r, value);
      }
    }
    return value;
  });
}

} // namespace rulechain
