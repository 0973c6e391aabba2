#include "rule.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace rulechain {

rule::rule(std::string name, rule_arguments args, modifier_list modifiers, const predicate &base)
    : name_(std::move(name))
    , args_(std::move(args))
    , modifiers_(std::move(modifiers))
{
  simple_predicate simple = base.simple;
  if (!simple) {
    simple = [name = name_](const nlohmann::json &) -> bool {
      throw std::logic_error("Rule '" + name + "' can only be evaluated asynchronously");
    };
  }

  async_predicate async = base.async;
  if (!async) {
    async = [simple](const nlohmann::json &value) {
      return std::async(std::launch::deferred, simple, value);
    };
  }

  test_       = compose(modifiers_, simple);
  test_async_ = compose_async(modifiers_, async);

  // What the modifiers make of a predicate that can never be satisfied. A fault resolves to this.
  fault_verdict_ = compose(modifiers_, [](const nlohmann::json &) { return false; })(nlohmann::json());
}

std::string rule::id() const
{
  std::string s;
  for (const auto &m: modifiers_)
    s += m->name() + ".";
  s += name_ + "(";
  for (size_t i = 0; i < args_.size(); ++i) {
    if (i != 0)
      s += ", ";
    s += format_argument(args_[i]);
  }
  s += ")";
  return s;
}

std::expected<bool, std::exception_ptr> rule::evaluate(const nlohmann::json &value) const
{
  try {
    return test_(value);
  } catch (...) {
    if (fault_verdict_) {
      spdlog::debug("Rule {} faulted, modifiers resolve the fault to a pass", id());
      return true;
    }
    return std::unexpected(std::current_exception());
  }
}

std::future<bool> rule::evaluate_async(const nlohmann::json &value) const
{
  return std::async(std::launch::deferred, [test = test_async_, verdict = fault_verdict_, value]() {
    try {
      return test(value).get();
    } catch (...) {
      if (verdict)
        return true;
      throw;
    }
  });
}

} // namespace rulechain
