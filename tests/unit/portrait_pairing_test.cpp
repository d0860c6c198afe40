#include "internal/query/portrait_pairing.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <vector>

namespace {

using framecache::query::PairPortraits;
using framecache::query::Slot;
using Ids = std::vector<std::optional<int64_t>>;

constexpr int64_t A = 1, B = 2, C = 3, D = 4, E = 5;

void TestLandscapeBetweenPortraitPair() {
  // [landscape A, portrait B, portrait C, landscape D]
  const Ids full      = {A, std::nullopt, std::nullopt, D};
  const Ids portraits = {B, C};

  const auto slots = PairPortraits(full, portraits);
  assert((slots == std::vector<Slot>{{A}, {B, C}, {D}}));
}

void TestOddPortraitLeftAlone() {
  // [portrait B, portrait C, portrait D]
  const Ids full      = {std::nullopt, std::nullopt, std::nullopt};
  const Ids portraits = {B, C, D};

  const auto slots = PairPortraits(full, portraits);
  assert((slots == std::vector<Slot>{{B, C}, {D}}));
}

void TestPairingCrossesLandscapes() {
  // a lone portrait before a landscape still takes the next portrait
  const Ids full      = {std::nullopt, A, std::nullopt, E};
  const Ids portraits = {B, C};

  const auto slots = PairPortraits(full, portraits);
  assert((slots == std::vector<Slot>{{B, C}, {A}, {E}}));
}

void TestLandscapeOnlyAndEmpty() {
  assert((PairPortraits({A, D}, {}) == std::vector<Slot>{{A}, {D}}));
  assert(PairPortraits({}, {}).empty());
}

void TestShortPortraitPassDegrades() {
  // portrait pass shorter than the holes (rows changed between passes)
  const Ids full      = {std::nullopt, std::nullopt, std::nullopt, A};
  const Ids portraits = {B};

  const auto slots = PairPortraits(full, portraits);
  assert((slots == std::vector<Slot>{{B}, {A}}));
}

} // namespace

int main() {
  TestLandscapeBetweenPortraitPair();
  TestOddPortraitLeftAlone();
  TestPairingCrossesLandscapes();
  TestLandscapeOnlyAndEmpty();
  TestShortPortraitPassDegrades();

  std::cout << "framecache_unit_portrait_pairing: pass\n";
  return 0;
}
