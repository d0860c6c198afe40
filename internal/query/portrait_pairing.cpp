#include "internal/query/portrait_pairing.hpp"

namespace framecache::query {

std::vector<Slot> PairPortraits(const std::vector<std::optional<int64_t>>& full, const std::vector<std::optional<int64_t>>& portraits) {
  std::vector<Slot> slots;
  slots.reserve(full.size());

  std::size_t next = 0;
  for (const auto& entry : full) {
    if (entry) {
      slots.push_back({*entry});
      continue;
    }

    Slot pair;
    while (pair.size() < 2 && next < portraits.size()) {
      if (const auto& id = portraits[next++]) pair.push_back(*id);
    }
    if (!pair.empty()) slots.push_back(std::move(pair));
  }

  return slots;
}

} // namespace framecache::query
