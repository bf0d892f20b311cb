#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace eventmix::core {

// A named mixed candidate: stems[0] is the anchor, the rest come from the train.
struct MixCombination {
  std::string name;
  std::vector<std::string> stems;

  size_t TrainStemCount() const { return stems.empty() ? 0 : stems.size() - 1; }
  const std::string& Anchor() const { return stems.front(); }

  // <name>_M, <name>_PT, <name>_Y, then <stem>_M/_PT/_Y per stem, then w_<anchor>.
  std::vector<std::string> OutputColumns() const {
    static const char* kSuffixes[] = {"_M", "_PT", "_Y"};
    std::vector<std::string> columns;
    for (const char* suffix : kSuffixes) columns.push_back(name + suffix);
    for (const auto& stem : stems) {
      for (const char* suffix : kSuffixes) columns.push_back(stem + suffix);
    }
    columns.push_back(WeightColumn());
    return columns;
  }
  std::string WeightColumn() const { return "w_" + Anchor(); }
};

}  // namespace eventmix::core
