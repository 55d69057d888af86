#pragma once

#include "sim/Simulation.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace antsim::core {

inline constexpr int kSimConfigVersion = 1;

// User-editable run configuration, stored as JSON.
struct SimConfig {
  std::uint64_t seed = 0x5EEDA17C0105ULL;
  float worldWidth = 1800.0f;
  float worldHeight = 1350.0f;

  int antCount = 50;
  int foodCount = 8;
  int puddleCount = 3;

  float pheromoneDecayRate = 1.0f;
  float simulationSpeed = 1.0f;
  sim::CarryMode carryMode = sim::CarryMode::AnyAmount;
  sim::TrailDecay foodTrailDecay = sim::TrailDecay::Linear;
  bool trailClusters = true;
  sim::Environment environment = sim::Environment::Mixed;
  bool showcase = false;

  std::string logLevel = "info";
};

// Missing keys keep their current value; out-of-range values are clamped and
// unknown enum names are ignored with a warning. False when the file cannot
// be read or is not a JSON object; `cfg` is left untouched then.
bool LoadSimConfig(SimConfig& cfg, const std::filesystem::path& path);

// Pretty-printed JSON; creates the parent directory.
bool SaveSimConfig(const SimConfig& cfg, const std::filesystem::path& path);

[[nodiscard]] sim::SimulationSettings ToSimulationSettings(const SimConfig& cfg);

} // namespace antsim::core
