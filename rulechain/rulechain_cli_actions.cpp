#include "rulechain_cli_actions.hpp"
#include "utilities.hpp"
#include <iostream>

#ifndef RULECHAIN_VERSION
#define RULECHAIN_VERSION "0.0.0"
#endif

namespace rulechain {

struct selection {
  validation_map validations;
  nlohmann::json document;
};

static std::shared_ptr<spdlog::logger> console()
{
  auto logger = spdlog::get("console");
  return logger ? logger : spdlog::default_logger();
}

static std::expected<selection, std::string> load_selection(const cxxopts::ParseResult &result)
{
  if (!result.count("rules"))
    return std::unexpected(std::string("Must provide a rules file with --rules"));
  if (!result.count("input"))
    return std::unexpected(std::string("Must provide a document with --input"));

  auto validations = load_validations(result["rules"].as<std::string>());
  if (!validations.has_value())
    return std::unexpected(validations.error());

  auto document = load_document(result["input"].as<std::string>());
  if (!document.has_value())
    return std::unexpected(document.error());

  if (result.count("name")) {
    const auto name = result["name"].as<std::string>();
    auto it         = validations->find(name);
    if (it == validations->end())
      return std::unexpected("No validation named '" + name + "'");
    validation_map only;
    only.insert(*it);
    return selection{ std::move(only), std::move(document.value()) };
  }

  return selection{ std::move(validations.value()), std::move(document.value()) };
}

cxxopts::Options cli_options()
{
  cxxopts::Options options("rulechain", "Fluent rule chain validator. Ver " RULECHAIN_VERSION);
  options.positional_help("<action>");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("r,rules", "YAML file declaring the validations", cxxopts::value<std::string>())
                       ("i,input", "JSON or YAML document to validate", cxxopts::value<std::string>())
                       ("n,name", "Only run the named validation", cxxopts::value<std::string>())
                       ("action", "Select from 'test', 'check', 'all', 'async' or 'list'", cxxopts::value<std::string>());
  // clang-format on

  options.parse_positional({ "action" });
  return options;
}

void print_failure(const validation_exception &failure, int depth)
{
  const std::string indent(static_cast<size_t>(depth) * 2, ' ');
  const std::string target = failure.target().has_value() ? failure.target().value() + ": " : "";
  console()->info("{}{}{} failed for {}", indent, target, failure.failed_rule().id(), format_argument(failure.value()));

  if (failure.fault())
    console()->info("{}  cause: {}", indent, failure.fault_message());

  for (const auto &cause: failure.causes())
    print_failure(cause, depth + 1);
}

int test_action(const cxxopts::ParseResult &result)
{
  auto loaded = load_selection(result);
  if (!loaded.has_value()) {
    spdlog::error("{}", loaded.error());
    return -1;
  }

  bool all_passed = true;
  for (const auto &[name, chain]: loaded->validations) {
    const bool passed = chain.test(loaded->document);
    console()->info("{}: {}", name, passed ? "pass" : "fail");
    all_passed = all_passed && passed;
  }
  return all_passed ? 0 : 1;
}

int check_action(const cxxopts::ParseResult &result)
{
  auto loaded = load_selection(result);
  if (!loaded.has_value()) {
    spdlog::error("{}", loaded.error());
    return -1;
  }

  bool all_passed = true;
  for (const auto &[name, chain]: loaded->validations) {
    try {
      chain.check(loaded->document);
      console()->info("{}: pass", name);
    } catch (const validation_exception &e) {
      console()->info("{}: fail", name);
      print_failure(e, 1);
      all_passed = false;
    }
  }
  return all_passed ? 0 : 1;
}

int all_action(const cxxopts::ParseResult &result)
{
  auto loaded = load_selection(result);
  if (!loaded.has_value()) {
    spdlog::error("{}", loaded.error());
    return -1;
  }

  bool all_passed = true;
  for (const auto &[name, chain]: loaded->validations) {
    const auto failures = chain.test_all(loaded->document);
    console()->info("{}: {} of {} rules failed", name, failures.size(), chain.rules().size());
    for (const auto &failure: failures)
      print_failure(failure, 1);
    all_passed = all_passed && failures.empty();
  }
  return all_passed ? 0 : 1;
}

int async_action(const cxxopts::ParseResult &result)
{
  auto loaded = load_selection(result);
  if (!loaded.has_value()) {
    spdlog::error("{}", loaded.error());
    return -1;
  }

  bool all_passed = true;
  for (const auto &[name, chain]: loaded->validations) {
    auto pending = chain.test_async(loaded->document);
    try {
      pending.get();
      console()->info("{}: pass", name);
    } catch (const validation_exception &e) {
      console()->info("{}: fail", name);
      print_failure(e, 1);
      all_passed = false;
    }
  }
  return all_passed ? 0 : 1;
}

int list_action(const cxxopts::ParseResult &result)
{
  std::cout << "modifiers:\n";
  for (const auto &name: modifier::names())
    std::cout << "  - " << name << "\n";

  std::cout << "rules:\n";
  for (const auto &name: predicate_registry::global().names())
    std::cout << "  - " << name << "\n";
  return 0;
}

} // namespace rulechain
