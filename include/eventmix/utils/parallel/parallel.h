#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace eventmix::utils::parallel {

class Parallel {
 public:
  using Index = int64_t;
  using Fn = std::function<void(Index)>;

  // Runs fn(i) for i in [begin, end) on the TBB pool. Exceptions thrown by fn
  // are collected and the first one (lowest index) is rethrown on the caller.
  static void For(Index begin, Index end, const Fn& fn);

  // Exclusive prefix sum; out.size() == counts.size() + 1, out.back() is the total.
  static std::vector<Index> PrefixSum(const std::vector<Index>& counts);
};

}  // namespace eventmix::utils::parallel
