#pragma once

#include <cstdint>
#include <list>
#include <unordered_map>
#include <utility>
#include <vector>

#include "eventmix/core/event_key.h"

namespace eventmix::core {

// Ordered pool of recently seen events, front = most recently promoted.
//
// Entries live in a std::list so promotion is a splice; the hash index maps
// each key to its list node. Capacity is not enforced here: the scanner
// calls EvictTail() before admitting a new event.
class Train {
 public:
  using Rows = std::vector<int64_t>;
  using Entry = std::pair<EventKey, Rows>;
  using const_iterator = std::list<Entry>::const_iterator;

  // Moves an existing key to the front without touching its rows, or inserts
  // a new key at the front.
  void PromoteOrInsert(const EventKey& key, Rows rows);

  // Removes and returns the back (least recently promoted) entry.
  // Throws std::runtime_error if the train is empty.
  Entry EvictTail();

  bool Contains(const EventKey& key) const;
  const Rows* Find(const EventKey& key) const;

  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }
  void Clear();

  std::vector<EventKey> Keys() const;
  std::vector<Rows> Values() const;
  // Every stored row, front to back, each event's rows in stored order.
  Rows FlattenRows() const;

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::list<Entry> entries_;
  std::unordered_map<EventKey, std::list<Entry>::iterator, EventKeyHash> index_;
};

}  // namespace eventmix::core
