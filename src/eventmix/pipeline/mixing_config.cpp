#include "eventmix/pipeline/mixing_config.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "eventmix/utils/json/json_utils.h"

namespace eventmix::pipeline {

using utils::json::JsonUtils;

MixingConfig MixingConfig::FromJson(const nlohmann::json& cfg) {
  const std::string context = "mixing";
  JsonUtils::RequireObject(cfg, context);
  JsonUtils::ValidateAllowedKeys(cfg,
                                 {"input", "output", "train_length", "run_column",
                                  "event_column", "progress", "verbose", "combinations"},
                                 context);

  MixingConfig out;
  if (!cfg.contains("input")) {
    throw std::runtime_error(context + " missing required key: input");
  }
  out.inputs = JsonUtils::StringOrStringArray(cfg.at("input"), context + ".input");
  if (out.inputs.empty()) {
    throw std::invalid_argument(context + ".input must name at least one file.");
  }
  out.output = JsonUtils::RequireStringField(cfg, "output", context);
  out.train_length = JsonUtils::RequirePositiveIntField(cfg, "train_length", context);
  out.key_columns.run = cfg.value("run_column", out.key_columns.run);
  out.key_columns.event = cfg.value("event_column", out.key_columns.event);
  out.options.progress = cfg.value("progress", false);
  out.options.verbose = cfg.value("verbose", false);

  const auto& combinations = JsonUtils::RequireArrayField(cfg, "combinations", context);
  if (combinations.empty()) {
    throw std::invalid_argument(context + ".combinations must not be empty.");
  }
  for (const auto& item : combinations) {
    const std::string item_context = context + ".combinations[]";
    JsonUtils::RequireObject(item, item_context);
    JsonUtils::ValidateAllowedKeys(item, {"name", "stems"}, item_context);
    core::MixCombination combination;
    combination.name = JsonUtils::RequireStringField(item, "name", item_context);
    combination.stems = JsonUtils::StringOrStringArray(
        JsonUtils::RequireArrayField(item, "stems", item_context), item_context + ".stems");
    if (combination.stems.size() < 2) {
      throw std::invalid_argument(item_context + " '" + combination.name +
                                  "' needs at least two stems.");
    }
    if (!out.combinations.empty() &&
        combination.stems.size() != out.combinations.front().stems.size()) {
      throw std::invalid_argument(item_context + " '" + combination.name + "' has " +
                                  std::to_string(combination.stems.size()) +
                                  " stems; every combination needs " +
                                  std::to_string(out.combinations.front().stems.size()) + ".");
    }
    out.combinations.push_back(std::move(combination));
  }
  return out;
}

std::vector<std::string> MixingConfig::InputColumns() const {
  std::vector<std::string> columns{key_columns.run, key_columns.event};
  for (const auto& combination : combinations) {
    for (const auto& stem : combination.stems) {
      for (const auto& name : core::StemColumns::ColumnNames(stem)) {
        if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
          columns.push_back(name);
        }
      }
    }
  }
  return columns;
}

}  // namespace eventmix::pipeline
