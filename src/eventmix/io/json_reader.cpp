#include "eventmix/io/json_reader.h"

#include <fstream>
#include <stdexcept>

namespace eventmix::io {

nlohmann::json JsonReader::ReadFile(const std::string& filepath) const {
  std::ifstream in(filepath);
  if (!in.is_open()) {
    throw std::runtime_error("JsonReader: could not open file: " + filepath);
  }

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("JsonReader: parse error in " + filepath + ": " + e.what());
  }
}

nlohmann::json JsonReader::Parse(const std::string& text) const {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("JsonReader: parse error: ") + e.what());
  }
}

}  // namespace eventmix::io
