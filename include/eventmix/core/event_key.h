#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace eventmix::core {

// (run, event) identifies one collision event.
struct EventKey {
  int64_t run{0};
  int64_t event{0};

  std::string ToString() const { return std::to_string(run) + "_" + std::to_string(event); }
};

inline bool operator==(const EventKey& a, const EventKey& b) {
  return a.run == b.run && a.event == b.event;
}
inline bool operator!=(const EventKey& a, const EventKey& b) { return !(a == b); }
inline bool operator<(const EventKey& a, const EventKey& b) {
  return a.run != b.run ? a.run < b.run : a.event < b.event;
}

struct EventKeyHash {
  size_t operator()(const EventKey& key) const {
    size_t h = std::hash<int64_t>{}(key.run);
    return h ^ (std::hash<int64_t>{}(key.event) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

// One scanned row: its position in the source table plus its event key.
struct EntryRef {
  int64_t row{0};
  EventKey key;
};

}  // namespace eventmix::core
