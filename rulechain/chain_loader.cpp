#include "chain_loader.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <ranges>

namespace rulechain {

static std::expected<validation, std::string> apply_step(const validation &chain, const std::string &step, const YAML::Node &args_node, const predicate_registry &registry)
{
  std::vector<std::string> parts;
  for (const auto &part_range: std::views::split(step, '.'))
    parts.emplace_back(part_range.begin(), part_range.end());

  if (std::ranges::any_of(parts, [](const std::string &part) { return part.empty(); }))
    return std::unexpected("Malformed step '" + step + "'");

  validation next = chain;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    auto pending = modifier::find(parts[i]);
    if (!pending)
      return std::unexpected("Unknown modifier '" + parts[i] + "' in step '" + step + "'");
    next = next.with_modifier(std::move(pending));
  }

  const std::string &rule_name = parts.back();
  if (rule_name == "schema") {
    if (!args_node.IsMap())
      return std::unexpected("Step '" + step + "' expects a map of fields");

    schema_fields fields;
    for (const auto &field: args_node) {
      const auto field_name = field.first.as<std::string>();
      auto field_chain      = parse_chain(field.second, registry);
      if (!field_chain.has_value())
        return std::unexpected("Field '" + field_name + "': " + field_chain.error());
      fields.emplace_back(field_name, std::move(field_chain.value()));
    }
    return next.schema(std::move(fields));
  }

  rule_arguments args;
  if (args_node.IsSequence()) {
    for (const auto &arg: args_node)
      args.push_back(yaml_to_json(arg));
  } else if (args_node.IsDefined() && !args_node.IsNull()) {
    args.push_back(yaml_to_json(args_node));
  }

  try {
    return next.with_rule(rule_name, std::move(args));
  } catch (const std::out_of_range &e) {
    return std::unexpected(std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    return std::unexpected("Step '" + step + "': " + e.what());
  }
}

std::expected<validation, std::string> parse_chain(const YAML::Node &node, const predicate_registry &registry)
{
  validation chain(registry);

  if (node.IsScalar())
    return apply_step(chain, node.Scalar(), YAML::Node(), registry);

  if (!node.IsSequence())
    return std::unexpected(std::string("A chain must be a sequence of steps"));

  for (const auto &step: node) {
    std::expected<validation, std::string> result;
    if (step.IsScalar()) {
      result = apply_step(chain, step.Scalar(), YAML::Node(), registry);
    } else if (step.IsMap() && step.size() == 1) {
      auto entry = step.begin();
      result     = apply_step(chain, entry->first.as<std::string>(), entry->second, registry);
    } else {
      return std::unexpected(std::string("A step must be a rule name or a single-entry map"));
    }

    if (!result.has_value())
      return std::unexpected(result.error());
    chain = std::move(result.value());
  }

  return chain;
}

std::expected<validation_map, std::string> parse_validations(const YAML::Node &document, const predicate_registry &registry)
{
  const auto &entries = document["validations"];
  if (!entries.IsDefined() || !entries.IsMap())
    return std::unexpected(std::string("Missing 'validations' map"));

  validation_map validations;
  for (const auto &entry: entries) {
    const auto name = entry.first.as<std::string>();
    auto chain      = parse_chain(entry.second, registry);
    if (!chain.has_value()) {
      spdlog::error("Validation '{}' is malformed: {}", name, chain.error());
      return std::unexpected("Validation '" + name + "': " + chain.error());
    }
    spdlog::debug("Loaded validation '{}' with {} rules", name, chain.value().rules().size());
    validations.insert_or_assign(name, std::move(chain.value()));
  }

  return validations;
}

std::expected<validation_map, std::string> load_validations(const std::filesystem::path &file_path, const predicate_registry &registry)
{
  YAML::Node document;
  try {
    document = YAML::LoadFile(file_path.string());
  } catch (const YAML::Exception &e) {
    spdlog::error("Failed to load rules file '{}': {}", file_path.string(), e.what());
    return std::unexpected("Failed to load '" + file_path.string() + "': " + e.what());
  }
  return parse_validations(document, registry);
}

std::expected<nlohmann::json, std::string> load_document(const std::filesystem::path &file_path)
{
  auto contents = get_file_contents<std::string>(file_path);
  if (!contents.has_value())
    return std::unexpected("Cannot read '" + file_path.string() + "': " + contents.error().message());

  const auto extension = file_path.extension();
  if (extension == ".yaml" || extension == ".yml") {
    try {
      return yaml_to_json(YAML::Load(contents.value()));
    } catch (const YAML::Exception &e) {
      return std::unexpected("Failed to parse '" + file_path.string() + "': " + e.what());
    }
  }

  auto document = nlohmann::json::parse(contents.value(), nullptr, false);
  if (document.is_discarded())
    return std::unexpected("Failed to parse '" + file_path.string() + "' as JSON");
  return document;
}

} // namespace rulechain
