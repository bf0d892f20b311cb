#pragma once

#include <cstdint>
#include <vector>

#include "eventmix/core/event_key.h"
#include "eventmix/core/event_table.h"

namespace eventmix::core {

// Row positions of `table` sorted by (run, event) ascending. Rows of one event
// keep their table order. Without key columns a warning is logged and the
// identity permutation is returned.
std::vector<int64_t> BuildOrderIndex(const EventTable& table);

// Materialises the ordered scan sequence. Throws if the key columns are absent.
std::vector<EntryRef> OrderedEntries(const EventTable& table, const std::vector<int64_t>& order);

}  // namespace eventmix::core
