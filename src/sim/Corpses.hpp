#pragma once

#include "SimTypes.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace antsim::sim {

struct Corpse {
  CorpseId id{kInvalidId};
  Vec2 position{};
  AntRole role{AntRole::Worker};
  bool collected{false};
};

// World list of dead ants waiting to be carried off.
class CorpseList final {
public:
  CorpseId add(Vec2 position, AntRole role);

  [[nodiscard]] const Corpse* try_get(CorpseId id) const;

  // Marks the corpse collected and drops it from the list. False if it was already gone.
  bool collect(CorpseId id);

  // Nearest uncollected corpse strictly closer than `max_distance`.
  [[nodiscard]] const Corpse* nearest(Vec2 pos, float max_distance) const;

  [[nodiscard]] std::size_t size() const noexcept { return corpses_.size(); }
  [[nodiscard]] std::span<const Corpse> corpses() const { return corpses_; }
  [[nodiscard]] std::size_t total_collected() const noexcept { return total_collected_; }

  void clear();

private:
  std::vector<Corpse> corpses_{};
  CorpseId next_id_{1};
  std::size_t total_collected_{0};
};

} // namespace antsim::sim
