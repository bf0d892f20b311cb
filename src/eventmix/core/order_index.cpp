#include "eventmix/core/order_index.h"

#include <algorithm>
#include <numeric>

#include <spdlog/spdlog.h>

#include "eventmix/utils/timing/timer.h"

namespace eventmix::core {

std::vector<int64_t> BuildOrderIndex(const EventTable& table) {
  utils::timing::ScopedTimer timer("mix.order_index");
  std::vector<int64_t> order(static_cast<size_t>(table.NumRows()));
  std::iota(order.begin(), order.end(), 0);

  const auto& columns = table.key_columns();
  if (!table.WarnMissing({columns.run, columns.event}, "OrderIndex").empty()) {
    return order;
  }

  std::vector<EventKey> keys(order.size());
  for (size_t i = 0; i < keys.size(); ++i) {
    keys[i] = table.KeyAt(static_cast<int64_t>(i));
  }
  std::stable_sort(order.begin(), order.end(),
                   [&](int64_t a, int64_t b) { return keys[a] < keys[b]; });
  return order;
}

std::vector<EntryRef> OrderedEntries(const EventTable& table, const std::vector<int64_t>& order) {
  std::vector<EntryRef> entries;
  entries.reserve(order.size());
  for (int64_t row : order) {
    entries.push_back(EntryRef{row, table.KeyAt(row)});
  }
  return entries;
}

}  // namespace eventmix::core
