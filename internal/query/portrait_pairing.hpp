#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace framecache::query {

// One slide: a single id, or two portrait ids shown side by side.
using Slot = std::vector<int64_t>;

/*
  Merges the two pairing passes into slots.

  full holds every matching row in order, nullopt marking a portrait
  position; portraits holds the portrait ids in the same order. Each
  landscape id becomes its own slot, each hole takes the next two
  portraits (or the last one left, or nothing once exhausted).
*/
std::vector<Slot> PairPortraits(const std::vector<std::optional<int64_t>>& full, const std::vector<std::optional<int64_t>>& portraits);

} // namespace framecache::query
