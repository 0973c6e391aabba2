#pragma once

#include "rulechain.hpp"
#include "predicate_registry.hpp"

namespace rulechain {

// Factories for the rules every registry starts with
predicate_registry::factory_map builtin_rule_factories();

/**
 * @brief Predicate validating an object field by field
 *
 * Has both forms. The simple form runs test_all for every field, the async form runs
 * test_async for one field at a time. Failures are raised as a nested_validation_error
 * whose entries carry the field name as target.
 */
predicate make_schema_predicate(schema_fields fields);

} // namespace rulechain
