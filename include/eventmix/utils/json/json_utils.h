#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace eventmix::utils::json {

class JsonUtils {
 public:
  static void RequireObject(const nlohmann::json& value, const std::string& context);
  static const nlohmann::json& RequireArrayField(const nlohmann::json& value,
                                                 const std::string& field_name,
                                                 const std::string& context);
  static void ValidateAllowedKeys(const nlohmann::json& object,
                                  const std::vector<std::string>& allowed_keys,
                                  const std::string& context);
  static std::string RequireStringField(const nlohmann::json& object,
                                        const std::string& field_name,
                                        const std::string& context);
  static int64_t RequirePositiveIntField(const nlohmann::json& object,
                                         const std::string& field_name,
                                         const std::string& context);
  // Accepts either "x" or ["x", "y", ...].
  static std::vector<std::string> StringOrStringArray(const nlohmann::json& value,
                                                      const std::string& context);
};

}  // namespace eventmix::utils::json
