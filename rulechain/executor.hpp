#pragma once

#include "rulechain.hpp"
#include "validation_exception.hpp"
#include <future>
#include <vector>

namespace rulechain {

// Execution strategies over a finalized list of rules. Rules always run in list order.

bool run_test(const rule_list &rules, const nlohmann::json &value);

// Throws validation_exception for the first rule that fails. Later rules are not evaluated.
void run_check(const rule_list &rules, const nlohmann::json &value);

// Evaluates every rule and returns one exception per failed rule
std::vector<validation_exception> run_test_all(const rule_list &rules, const nlohmann::json &value);

/**
 * @brief Evaluates the rules one after the other on a worker thread
 *
 * Rule i+1 is only started once rule i has settled. The future yields the value
 * unchanged when every rule passes, otherwise get() throws the validation_exception
 * of the first rule that failed; no rule after it is started.
 */
std::future<nlohmann::json> run_test_async(rule_list rules, nlohmann::json value);

} // namespace rulechain
