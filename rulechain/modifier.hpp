#pragma once

#include "rulechain.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rulechain {

/**
 * @brief A named transformation applied to the predicate of the next rule in a chain
 *
 * Modifiers are interned: every chain refers to the same shared instance for a given name.
 */
class modifier {
public:
  typedef std::function<simple_predicate(simple_predicate)> simple_transform;
  typedef std::function<async_predicate(async_predicate)> async_transform;

  modifier(std::string name, simple_transform simple, async_transform async);

  const std::string &name() const
  {
    return name_;
  }

  // Takes part in synchronous composition
  bool is_simple() const
  {
    return static_cast<bool>(simple_);
  }

  // Wraps asynchronous predicates with a transform of its own
  bool is_async_aware() const
  {
    return static_cast<bool>(async_);
  }

  simple_predicate perform(simple_predicate next) const;
  async_predicate perform_async(async_predicate next) const;

  /**
   * @brief Looks up an interned modifier
   * @param name One of "not", "some" or "every"
   * @return The shared modifier or nullptr when the name is unknown
   */
  static modifier_ptr find(std::string_view name);
  static std::vector<std::string> names();

private:
  std::string name_;
  simple_transform simple_;
  async_transform async_;
};

/**
 * @brief Wraps a base predicate with the modifiers that were pending when its rule was added
 *
 * The first chained modifier ends up outermost, so "not.every.even" reads as
 * not(every(even)) and "every.not.even" as every(not(even)).
 */
simple_predicate compose(const modifier_list &modifiers, simple_predicate base);
async_predicate compose_async(const modifier_list &modifiers, async_predicate base);

} // namespace rulechain
