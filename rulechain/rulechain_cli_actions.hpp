#pragma once

#include "chain_loader.hpp"
#include "validation.hpp"
#include <cxxopts.hpp>
#include "spdlog/spdlog.h"
#include <unordered_map>
#include <functional>

namespace rulechain {

using action_handler = std::function<int(const cxxopts::ParseResult &)>;

int test_action(const cxxopts::ParseResult &result);
int check_action(const cxxopts::ParseResult &result);
int all_action(const cxxopts::ParseResult &result);
int async_action(const cxxopts::ParseResult &result);
int list_action(const cxxopts::ParseResult &result);

// clang-format off
const std::unordered_map<std::string, action_handler> cli_actions = {
  { "test", test_action },
  { "check", check_action },
  { "all", all_action },
  { "async", async_action },
  { "list", list_action }
};
// clang-format on

// Command line options shared by the executable and its tests, with 'action' as the positional argument
cxxopts::Options cli_options();

// Writes a failure and its nested causes, one line each, indented by depth
void print_failure(const validation_exception &failure, int depth = 0);

} // namespace rulechain
