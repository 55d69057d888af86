#pragma once

#include "Ant.hpp"
#include "Colony.hpp"
#include "Corpses.hpp"
#include "EventScheduler.hpp"
#include "FoodManager.hpp"
#include "HazardField.hpp"
#include "PheromoneField.hpp"
#include "SimTypes.hpp"
#include "SimulationContext.hpp"
#include "Snapshot.hpp"
#include "Termite.hpp"
#include "Terrain.hpp"
#include "core/Rng.hpp"

#include <entt/signal/dispatcher.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace antsim::sim {

inline constexpr float kMinSimulationSpeed = 0.1f;
inline constexpr float kMaxSimulationSpeed = 10.0f;

struct SimulationSettings {
  std::uint64_t seed{0x5EEDA17C0105ULL};
  Bounds bounds{};
  Environment environment{Environment::Mixed};

  std::size_t ant_count{50};
  std::size_t food_count{8};
  std::size_t puddle_count{3};

  float pheromone_decay_rate{1.0f};
  float simulation_speed{1.0f};
  TrailDecay food_trail_decay{TrailDecay::Linear};
  CarryMode carry_mode{CarryMode::AnyAmount};
  bool trail_clusters{true};

  // Every initial ant at once, no periodic spawning, no breeding, no random events.
  bool showcase{false};

  float initial_spawn_interval_sec{2.0f};
  float max_substep_sec{0.1f};
  float food_min_colony_distance{100.0f};

  PheromoneTuning pheromone{};
  HazardTuning hazard{};
  AntTuning ant{};
  ColonyTuning colony{};
  TermiteTuning termite{};
  SchedulerTuning scheduler{};
};

// Owns the world and drives it. The host calls advance() with wall-clock
// milliseconds; everything inside runs on fixed sub-steps in seconds.
class Simulation final {
public:
  // A null `world` builds a TerrainGrid over the configured bounds.
  explicit Simulation(const SimulationSettings& settings, std::unique_ptr<WorldQuery> world = nullptr);

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // Scales by the speed knob and splits into sub-steps of at most max_substep_sec.
  void advance(double delta_ms);

  // One sub-step, in simulated seconds.
  void step(float dt_sec);

  // Tears everything down and repopulates from the current settings.
  void reset();

  // ---- Host actions ----------------------------------------------------------
  FoodId add_food_at(Vec2 position, float amount);
  // 50..200 food somewhere away from the colony. kInvalidId when no spot was found.
  FoodId add_random_food();

  bool start_termite_attack();
  bool start_rain(float duration_sec);
  bool start_rain();

  // ---- Knobs ---------------------------------------------------------------
  void set_paused(bool paused) noexcept { paused_ = paused; }
  [[nodiscard]] bool paused() const noexcept { return paused_; }

  void set_simulation_speed(float speed) noexcept;
  [[nodiscard]] float simulation_speed() const noexcept { return settings_.simulation_speed; }

  void set_pheromone_decay_rate(float rate) noexcept;

  // Take effect on the next reset().
  void set_ant_count(std::size_t count) noexcept { settings_.ant_count = count; }
  void set_food_count(std::size_t count) noexcept { settings_.food_count = count; }

  // ---- Queries -------------------------------------------------------------
  [[nodiscard]] Snapshot snapshot() const;
  [[nodiscard]] entt::dispatcher& events() noexcept { return events_; }

  [[nodiscard]] const SimulationSettings& settings() const noexcept { return settings_; }
  [[nodiscard]] double elapsed_sec() const noexcept { return elapsed_sec_; }
  [[nodiscard]] bool attack_active() const noexcept { return attack_active_; }
  [[nodiscard]] std::size_t initial_ants_pending() const noexcept { return initial_remaining_; }

  [[nodiscard]] Colony& colony() noexcept { return *colony_; }
  [[nodiscard]] const Colony& colony() const noexcept { return *colony_; }
  [[nodiscard]] PheromoneField& pheromones() noexcept { return pheromones_; }
  [[nodiscard]] FoodManager& food() noexcept { return food_; }
  [[nodiscard]] HazardField& hazards() noexcept { return hazards_; }
  [[nodiscard]] CorpseList& corpses() noexcept { return corpses_; }
  [[nodiscard]] TermiteSwarm& termites() noexcept { return termites_; }
  [[nodiscard]] EventScheduler& scheduler() noexcept { return scheduler_; }
  [[nodiscard]] const WorldQuery& world() const noexcept { return *world_; }
  [[nodiscard]] core::Rng& rng() noexcept { return rng_; }

  // Handles into the current world, for callers that drive subsystems directly.
  [[nodiscard]] SimulationContext context();

private:
  SimulationSettings settings_{};
  core::Rng rng_{};
  std::unique_ptr<WorldQuery> world_{};
  TerrainGrid* terrain_{nullptr}; // set when world_ is our own grid

  PheromoneField pheromones_{};
  FoodManager food_{};
  HazardField hazards_{};
  CorpseList corpses_{};
  std::unique_ptr<Colony> colony_{};
  TermiteSwarm termites_{};
  EventScheduler scheduler_{};
  entt::dispatcher events_{};

  double elapsed_sec_{0.0};
  bool paused_{false};
  bool attack_active_{false};
  std::size_t initial_remaining_{0};
  float initial_timer_sec_{0.0f};

  void populate();
  void update_initial_spawn(float dt_sec, SimulationContext& ctx);
  void apply(const ScheduledEvents& fired, SimulationContext& ctx);
  void end_attack(SimulationContext& ctx);
};

} // namespace antsim::sim
