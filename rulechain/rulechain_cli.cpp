#include "rulechain_cli_actions.hpp"
#include <cxxopts.hpp>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <iostream>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

int main(int argc, char **argv)
{
  // Setup logging
  std::error_code error_code;
  fs::remove("rulechain.log", error_code);

  auto console = spdlog::stdout_color_mt("console");
  console->set_pattern("%v");

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>("rulechain.log", true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("rulechain-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open rulechain.log: " << e.what() << "\n";
      return -1;
    }
  }
  file_log->set_level(spdlog::level::trace);

  auto rulechain_log = std::make_shared<spdlog::logger>("rulechain_log", spdlog::sinks_init_list{ console_error, file_log });
  rulechain_log->set_level(spdlog::level::trace);
  spdlog::set_default_logger(rulechain_log);

  auto options = rulechain::cli_options();

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cout << options.help() << std::endl;
    return -1;
  }

  if (result.count("help") || !result.count("action")) {
    std::cout << options.help() << std::endl;
    return 0;
  }

  const auto action = result["action"].as<std::string>();
  auto action_it    = rulechain::cli_actions.find(action);
  if (action_it == rulechain::cli_actions.end()) {
    spdlog::error("Unknown action '{}'", action);
    std::cout << options.help() << std::endl;
    return -1;
  }

  const int status = action_it->second(result);
  spdlog::shutdown();
  return status;
}
