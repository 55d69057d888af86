#pragma once

#include "SimTypes.hpp"
#include "Target.hpp"

#include <optional>

namespace antsim::sim {

// Something an ant noticed this tick.
template <class Id>
struct Sighting {
  Id id{kInvalidId};
  Vec2 position{};
  float distance{0.0f};
};

// The parts of an ant the decision depends on.
struct AntMind {
  AntRole role{AntRole::Worker};
  AntState state{AntState::Exploring};
  bool carrying_food{false};
  bool carrying_corpse{false};
  Target target{};
  bool target_valid{false};
};

// Gathered once per tick, each field already limited to its sensing radius.
struct AntPerception {
  bool attack_active{false};
  std::optional<Sighting<TermiteId>> termite;  // nearest live termite, 150
  std::optional<Sighting<CorpseId>> corpse;    // nearest uncollected corpse, 100
  std::optional<Sighting<DepositId>> danger;   // strongest Danger deposit, 80
  std::optional<Sighting<DepositId>> trail;    // strongest FoodTrail deposit, 50
  std::optional<Sighting<FoodId>> food;        // nearest active food, 300
};

struct AntDecision {
  AntState state{AntState::Exploring};
  Target target{};

  bool flee{false};        // repel from flee_from this tick
  Vec2 flee_from{};
  bool reset_speed{false}; // danger cleared, drop the flight boost
};

// Priority-ordered state selection. Pure: reads nothing but its arguments.
// Resting ants are never passed in.
[[nodiscard]] AntDecision decide(const AntMind& mind, const AntPerception& seen);

} // namespace antsim::sim
