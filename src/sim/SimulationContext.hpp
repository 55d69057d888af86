#pragma once

#include "SimTypes.hpp"

#include <entt/signal/dispatcher.hpp>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

class PheromoneField;
class FoodManager;
class HazardField;
class CorpseList;
class Colony;
class TermiteSwarm;
class WorldQuery;
struct AntTuning;

// Everything a tick may touch, handed down explicitly. Built by Simulation
// for each step; tests assemble their own over a hand-made world.
struct SimulationContext {
  PheromoneField& pheromones;
  FoodManager& food;
  HazardField& hazards;
  CorpseList& corpses;
  Colony& colony;
  TermiteSwarm& termites;
  const WorldQuery& world;
  core::Rng& rng;
  entt::dispatcher& events;
  const AntTuning& ant_tuning;

  Weather weather{Weather::Clear};
  bool attack_active{false};
};

} // namespace antsim::sim
