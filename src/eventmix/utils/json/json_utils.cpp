#include "eventmix/utils/json/json_utils.h"

#include <algorithm>
#include <stdexcept>

namespace eventmix::utils::json {

void JsonUtils::RequireObject(const nlohmann::json& value, const std::string& context) {
  if (!value.is_object()) {
    throw std::runtime_error(context + " must be a JSON object.");
  }
}

const nlohmann::json& JsonUtils::RequireArrayField(const nlohmann::json& value,
                                                   const std::string& field_name,
                                                   const std::string& context) {
  if (!value.contains(field_name) || !value.at(field_name).is_array()) {
    throw std::runtime_error(context + " missing required array: " + field_name);
  }
  return value.at(field_name);
}

void JsonUtils::ValidateAllowedKeys(const nlohmann::json& object,
                                    const std::vector<std::string>& allowed_keys,
                                    const std::string& context) {
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (std::find(allowed_keys.begin(), allowed_keys.end(), it.key()) == allowed_keys.end()) {
      throw std::runtime_error(context + " has unsupported key: " + it.key());
    }
  }
}

std::string JsonUtils::RequireStringField(const nlohmann::json& object,
                                          const std::string& field_name,
                                          const std::string& context) {
  if (!object.contains(field_name) || !object.at(field_name).is_string()) {
    throw std::runtime_error(context + " missing required string: " + field_name);
  }
  return object.at(field_name).get<std::string>();
}

int64_t JsonUtils::RequirePositiveIntField(const nlohmann::json& object,
                                           const std::string& field_name,
                                           const std::string& context) {
  if (!object.contains(field_name) || !object.at(field_name).is_number_integer()) {
    throw std::runtime_error(context + " missing required integer: " + field_name);
  }
  auto value = object.at(field_name).get<int64_t>();
  if (value <= 0) {
    throw std::invalid_argument(context + "." + field_name + " must be positive.");
  }
  return value;
}

std::vector<std::string> JsonUtils::StringOrStringArray(const nlohmann::json& value,
                                                        const std::string& context) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  if (!value.is_array()) {
    throw std::runtime_error(context + " must be a string or an array of strings.");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw std::runtime_error(context + " must only contain strings.");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

}  // namespace eventmix::utils::json
