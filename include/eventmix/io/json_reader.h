#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace eventmix::io {

class JsonReader {
 public:
  nlohmann::json ReadFile(const std::string& filepath) const;
  nlohmann::json Parse(const std::string& text) const;
};

}  // namespace eventmix::io
