#include "modifier.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <map>

namespace rulechain {

// A fault raised while testing one element counts as that element not satisfying the predicate
static bool element_satisfies(const simple_predicate &next, const nlohmann::json &element)
{
  try {
    return next(element);
  } catch (const std::exception &e) {
    spdlog::trace("Element {} faulted inside quantifier: {}", format_argument(element), e.what());
    return false;
  } catch (...) {
    spdlog::trace("Element {} faulted inside quantifier", format_argument(element));
    return false;
  }
}

static bool element_satisfies_async(const async_predicate &next, const nlohmann::json &element)
{
  try {
    return next(element).get();
  } catch (const std::exception &e) {
    spdlog::trace("Element {} faulted inside quantifier: {}", format_argument(element), e.what());
    return false;
  } catch (...) {
    spdlog::trace("Element {} faulted inside quantifier", format_argument(element));
    return false;
  }
}

// every: stop on the first element that fails. some: stop on the first element that passes.
static simple_predicate quantify(simple_predicate next, bool every)
{
  return [next = std::move(next), every](const nlohmann::json &value) {
    auto elements = as_sequence(value);
    if (!elements) {
      spdlog::trace("Cannot quantify over non-sequence {}", format_argument(value));
      return false;
    }
    for (const auto &element: *elements) {
      if (element_satisfies(next, element) != every)
        return !every;
    }
    return every;
  };
}

static async_predicate quantify_async(async_predicate next, bool every)
{
  return [next = std::move(next), every](const nlohmann::json &value) {
    return std::async(std::launch::deferred, [next, every, value]() {
      auto elements = as_sequence(value);
      if (!elements) {
        spdlog::trace("Cannot quantify over non-sequence {}", format_argument(value));
        return false;
      }
      // Elements are awaited one at a time, never concurrently
      for (const auto &element: *elements) {
        if (element_satisfies_async(next, element) != every)
          return !every;
      }
      return every;
    });
  };
}

static const std::map<std::string, modifier_ptr, std::less<>> &modifier_table()
{
  // clang-format off
  static const std::map<std::string, modifier_ptr, std::less<>> table = {
    { "not", std::make_shared<const modifier>("not",
        [](simple_predicate next) -> simple_predicate {
          return [next = std::move(next)](const nlohmann::json &value) { return !next(value); };
        },
        [](async_predicate next) -> async_predicate {
          return [next = std::move(next)](const nlohmann::json &value) {
            return std::async(std::launch::deferred, [next, value]() { return !next(value).get(); });
          };
        }) },
    { "some", std::make_shared<const modifier>("some",
        [](simple_predicate next) { return quantify(std::move(next), false); },
        [](async_predicate next) { return quantify_async(std::move(next), false); }) },
    { "every", std::make_shared<const modifier>("every",
        [](simple_predicate next) { return quantify(std::move(next), true); },
        [](async_predicate next) { return quantify_async(std::move(next), true); }) },
  };
  // clang-format on
  return table;
}

modifier::modifier(std::string name, simple_transform simple, async_transform async)
    : name_(std::move(name))
    , simple_(std::move(simple))
    , async_(std::move(async))
{
}

simple_predicate modifier::perform(simple_predicate next) const
{
  if (!simple_)
    return next;
  return simple_(std::move(next));
}

async_predicate modifier::perform_async(async_predicate next) const
{
  if (async_)
    return async_(std::move(next));
  if (!simple_)
    return next;

  // Settle the inner result first, then run the synchronous transform over it
  return [next = std::move(next), simple = simple_](const nlohmann::json &value) {
    return std::async(std::launch::deferred, [next, simple, value]() {
      const bool settled = next(value).get();
      return simple([settled](const nlohmann::json &) { return settled; })(value);
    });
  };
}

modifier_ptr modifier::find(std::string_view name)
{
  const auto &table = modifier_table();
  auto it           = table.find(name);
  if (it == table.end())
    return nullptr;
  return it->second;
}

std::vector<std::string> modifier::names()
{
  std::vector<std::string> result;
  for (const auto &i: modifier_table())
    result.push_back(i.first);
  return result;
}

simple_predicate compose(const modifier_list &modifiers, simple_predicate base)
{
  for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it)
    base = (*it)->perform(std::move(base));
  return base;
}

async_predicate compose_async(const modifier_list &modifiers, async_predicate base)
{
  for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it)
    base = (*it)->perform_async(std::move(base));
  return base;
}

} // namespace rulechain
