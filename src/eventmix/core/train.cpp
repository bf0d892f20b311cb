#include "eventmix/core/train.h"

#include <stdexcept>

namespace eventmix::core {

void Train::PromoteOrInsert(const EventKey& key, Rows rows) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    entries_.splice(entries_.begin(), entries_, it->second);
    return;
  }
  entries_.emplace_front(key, std::move(rows));
  index_.emplace(key, entries_.begin());
}

Train::Entry Train::EvictTail() {
  if (entries_.empty()) {
    throw std::runtime_error("Train::EvictTail called on an empty train.");
  }
  Entry tail = std::move(entries_.back());
  index_.erase(tail.first);
  entries_.pop_back();
  return tail;
}

bool Train::Contains(const EventKey& key) const {
  return index_.find(key) != index_.end();
}

const Train::Rows* Train::Find(const EventKey& key) const {
  auto it = index_.find(key);
  return it == index_.end() ? nullptr : &it->second->second;
}

void Train::Clear() {
  entries_.clear();
  index_.clear();
}

std::vector<EventKey> Train::Keys() const {
  std::vector<EventKey> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.first);
  }
  return keys;
}

std::vector<Train::Rows> Train::Values() const {
  std::vector<Rows> values;
  values.reserve(entries_.size());
  for (const auto& entry : entries_) {
    values.push_back(entry.second);
  }
  return values;
}

Train::Rows Train::FlattenRows() const {
  Rows flat;
  for (const auto& entry : entries_) {
    flat.insert(flat.end(), entry.second.begin(), entry.second.end());
  }
  return flat;
}

}  // namespace eventmix::core
