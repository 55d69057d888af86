#pragma once

#include "AntBrain.hpp"
#include "SimTypes.hpp"
#include "Target.hpp"

#include <string_view>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

struct SimulationContext;

struct AntTuning {
  float max_energy{100.0f};
  float energy_drain_per_sec{0.1f};
  float max_carry{10.0f};
  CarryMode carry_mode{CarryMode::AnyAmount};

  float min_speed{80.0f};
  float max_speed{120.0f};
  float min_speed_variation{0.8f};
  float max_speed_variation{1.2f};

  // Sensing radii.
  float termite_sense{150.0f};
  float corpse_sense{100.0f};
  float danger_sense{80.0f};
  float trail_sense{50.0f};
  float food_sense{300.0f};

  // Arrival radii.
  float collect_radius{20.0f};
  float home_radius{30.0f};
  float trail_arrival_radius{15.0f};
  float next_trail_radius{30.0f};
  float attack_range{20.0f};
  float hide_radius{50.0f};
  float corpse_pickup_radius{15.0f};

  float attack_damage{15.0f};
  float attack_energy_cost{5.0f};
  float feed_energy_cost{5.0f};
  float feed_chance{0.3f};
  float home_energy_gain{20.0f};

  float flee_speed_multiplier{1.8f};
  float flee_speed_cap{200.0f};
  float flee_jitter_rad{kPi / 4.0f};

  float wander_jitter{0.3f};
  float heading_jitter{0.05f};

  float pheromone_interval_sec{0.1f};
  float exploration_intensity{0.3f};
  bool trail_clusters{true};
  float cluster_threshold{0.9f};
  int cluster_size{2};
  float cluster_intensity{0.4f};
  float cluster_spread{6.0f};
};

// Coarse health label derived from colony storage.
enum class AntStatus : std::uint8_t { Healthy, Weak, NeedsFood, Sick };

[[nodiscard]] constexpr std::string_view to_string(AntStatus s) noexcept {
  switch (s) {
    case AntStatus::Healthy:   return "Healthy";
    case AntStatus::Weak:      return "Weak";
    case AntStatus::NeedsFood: return "Needs Food";
    case AntStatus::Sick:      return "Sick";
    default:                   return "unknown";
  }
}

[[nodiscard]] constexpr AntStatus status_for_storage(float colony_storage) noexcept {
  if (colony_storage < 20.0f) return AntStatus::Sick;
  if (colony_storage < 50.0f) return AntStatus::NeedsFood;
  if (colony_storage < 100.0f) return AntStatus::Weak;
  return AntStatus::Healthy;
}

class Ant final {
public:
  Ant(AntId id, AntRole role, Vec2 position, const AntTuning& tuning, core::Rng& rng);

  // One tick: energy, hazard exposure, rest timer, decision, behaviour, scent, movement.
  void update(float dt_sec, SimulationContext& ctx);

  [[nodiscard]] AntId id() const noexcept { return id_; }
  [[nodiscard]] AntRole role() const noexcept { return role_; }
  [[nodiscard]] AntState state() const noexcept { return state_; }
  [[nodiscard]] const Target& target() const noexcept { return target_; }

  [[nodiscard]] Vec2 position() const noexcept { return position_; }
  [[nodiscard]] Vec2 home() const noexcept { return home_; }
  [[nodiscard]] float heading() const noexcept { return heading_; }
  [[nodiscard]] float speed() const noexcept { return speed_; }
  [[nodiscard]] float base_speed() const noexcept { return base_speed_; }

  [[nodiscard]] float energy() const noexcept { return energy_; }
  [[nodiscard]] float max_energy() const noexcept { return max_energy_; }
  [[nodiscard]] bool alive() const noexcept { return !dead_; }
  [[nodiscard]] DeathCause death_cause() const noexcept { return death_cause_; }

  [[nodiscard]] float food_amount() const noexcept { return food_amount_; }
  [[nodiscard]] bool carrying_food() const noexcept { return carrying_food_; }
  [[nodiscard]] bool carrying_corpse() const noexcept { return carrying_corpse_; }

  [[nodiscard]] float rest_remaining_sec() const noexcept { return rest_remaining_sec_; }
  [[nodiscard]] float hazard_exposure_sec() const noexcept { return hazard_exposure_sec_; }
  [[nodiscard]] bool hazard_penalized() const noexcept { return hazard_penalized_; }
  [[nodiscard]] bool hazard_warned() const noexcept { return hazard_warned_; }

  [[nodiscard]] float food_collected() const noexcept { return food_collected_; }
  [[nodiscard]] std::uint32_t corpses_collected() const noexcept { return corpses_collected_; }
  [[nodiscard]] float lifespan_sec() const noexcept { return lifespan_sec_; }
  [[nodiscard]] bool fed_brood() const noexcept { return fed_brood_; }

  // Positive amounts only; never above max energy.
  void add_energy(float amount) noexcept;

  // Termite bite. Kills the ant at zero energy.
  void take_damage(float amount, SimulationContext& ctx);

  // Rest 4..7 s after a cycle that also fed the brood, 3..5 s otherwise.
  void start_resting(core::Rng& rng);

  // Attack over: drop whatever the ant was doing.
  void reset_to_exploring(SimulationContext& ctx);

  void mark_hazard_warned() noexcept { hazard_warned_ = true; }

  // Flags the ant dead, leaves a corpse and queues AntDied. No-op when already dead.
  void die(DeathCause cause, SimulationContext& ctx);

  // Test hooks.
  void set_position(Vec2 p) noexcept { position_ = p; }
  void set_energy(float e) noexcept { energy_ = e; }
  void set_heading(float h) noexcept { heading_ = h; }
  void set_state(AntState s, Target t, SimulationContext& ctx);
  void set_carried_food(float amount) noexcept;

private:
  AntId id_{kInvalidId};
  AntRole role_{AntRole::Worker};
  AntState state_{AntState::Exploring};
  Target target_{};

  Vec2 position_{};
  Vec2 home_{};
  float heading_{0.0f};
  float wander_angle_{0.0f};
  float speed_{0.0f};
  float base_speed_{0.0f};
  float flee_jitter_{0.0f};
  bool moving_{true};

  float energy_{100.0f};
  float max_energy_{100.0f};
  float max_carry_{10.0f};
  bool dead_{false};
  DeathCause death_cause_{DeathCause::Starvation};

  float food_amount_{0.0f};
  bool carrying_food_{false};
  bool carrying_corpse_{false};

  float pheromone_timer_sec_{0.0f};
  float rest_remaining_sec_{0.0f};
  float hazard_exposure_sec_{0.0f};
  bool hazard_penalized_{false};
  bool hazard_warned_{false};

  float food_collected_{0.0f};
  std::uint32_t corpses_collected_{0};
  float lifespan_sec_{0.0f};
  bool fed_brood_{false};

  [[nodiscard]] AntPerception perceive(const SimulationContext& ctx) const;
  void apply(const AntDecision& decision, SimulationContext& ctx);

  // Swaps the target, moving follower counts along with it.
  void retarget(Target next, SimulationContext& ctx);

  void update_hazard(float dt_sec, SimulationContext& ctx);

  void explore(core::Rng& rng, const AntTuning& t);
  void seek_food(SimulationContext& ctx);
  void return_home(SimulationContext& ctx);
  void follow_trail(SimulationContext& ctx);
  void attack_termite(SimulationContext& ctx);
  void hide(SimulationContext& ctx);
  void feed_brood(SimulationContext& ctx);
  void collect_corpse(SimulationContext& ctx);

  void steer_to(Vec2 p) noexcept;
  void emit_pheromones(float dt_sec, SimulationContext& ctx);
  void move(float dt_sec, SimulationContext& ctx);
};

} // namespace antsim::sim
