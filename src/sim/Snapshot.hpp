#pragma once

#include "Ant.hpp"
#include "Colony.hpp"
#include "FoodManager.hpp"
#include "HazardField.hpp"
#include "SimTypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace antsim::sim {

// Read-only view of the world for presentation. Dead-but-unswept ants are not counted.
struct Snapshot {
  double elapsed_sec{0.0};
  bool paused{false};

  std::size_t population{0};
  std::size_t max_population{0};
  float food_storage{0.0f};
  float spawn_cost{0.0f};
  std::uint32_t total_born{0};
  std::uint32_t total_died{0};
  std::uint32_t generation{1};
  float efficiency{1.0f};
  AntStatus ant_status{AntStatus::Healthy};

  bool has_queen{false};
  FlightState flight{FlightState::Idle};
  BroodStages brood{};
  std::uint32_t emerged{0};

  std::array<std::size_t, kPheromoneTypeCount> pheromones{};
  std::size_t pheromone_total{0};
  std::array<std::size_t, kAntStateCount> ant_states{};

  std::size_t termites_alive{0};
  bool attack_active{false};
  bool raining{false};
  float rain_remaining_sec{0.0f};

  FoodStats food{};
  HazardStats hazards{};
  std::size_t corpses{0};
  std::size_t corpses_collected{0};

  [[nodiscard]] std::size_t ants_in(AntState s) const noexcept { return ant_states[static_cast<std::size_t>(s)]; }
  [[nodiscard]] std::size_t deposits_of(PheromoneType t) const noexcept {
    return pheromones[static_cast<std::size_t>(t)];
  }
};

// One-line summary for the log.
[[nodiscard]] std::string describe(const Snapshot& s);

} // namespace antsim::sim
