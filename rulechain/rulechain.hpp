#pragma once

#include "nlohmann/json.hpp"
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace rulechain {

class rule;
class modifier;
class validation;
class validation_exception;
class predicate_registry;

typedef std::vector<nlohmann::json> rule_arguments;
typedef std::function<bool(const nlohmann::json &)> simple_predicate;
typedef std::function<std::future<bool>(const nlohmann::json &)> async_predicate;

typedef std::shared_ptr<const rule> rule_ptr;
typedef std::shared_ptr<const modifier> modifier_ptr;
typedef std::vector<rule_ptr> rule_list;
typedef std::vector<modifier_ptr> modifier_list;

// Ordered field name to validation pairs consumed by the schema rule
typedef std::vector<std::pair<std::string, validation>> schema_fields;

/**
 * @brief A named predicate as produced by a registry factory
 *
 * Either form may be empty but not both. The executor lifts a missing async form
 * from the simple one; a missing simple form faults when evaluated synchronously.
 */
struct predicate {
  simple_predicate simple;
  async_predicate async;

  bool has_simple() const
  {
    return static_cast<bool>(simple);
  }
  bool has_async() const
  {
    return static_cast<bool>(async);
  }
};

} // namespace rulechain
