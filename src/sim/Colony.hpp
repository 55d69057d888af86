#pragma once

#include "Ant.hpp"
#include "SimTypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace antsim::sim {

struct SimulationContext;

enum class FlightState : std::uint8_t {
  Idle          = 0,
  NuptialFlight = 1,
  PostFlight    = 2
};

[[nodiscard]] constexpr std::string_view to_string(FlightState s) noexcept {
  switch (s) {
    case FlightState::Idle:          return "idle";
    case FlightState::NuptialFlight: return "nuptial_flight";
    case FlightState::PostFlight:    return "post_flight";
    default:                         return "unknown";
  }
}

struct BroodStages {
  std::uint32_t eggs{0};
  std::uint32_t larvae{0};
  std::uint32_t pupae{0};
  std::uint32_t adults{0};

  [[nodiscard]] constexpr std::uint32_t total() const noexcept { return eggs + larvae + pupae + adults; }
};

struct ColonyTuning {
  float initial_food{500.0f};
  std::size_t max_population{200};
  std::size_t population_ceiling{300};
  float spawn_cost{10.0f};
  float spawn_cost_floor{5.0f};
  float spawn_interval_sec{5.0f};
  float spawn_spread{20.0f};
  float queen_chance{0.05f};

  float flight_interval_sec{60.0f};
  float flight_cost{300.0f};
  float flight_duration_sec{10.0f};
  float post_flight_sec{5.0f};
  int min_eggs{20};
  int max_eggs{50};

  float egg_window_sec{45.0f};
  float larva_window_sec{30.0f};
  float pupa_window_sec{30.0f};
  float larva_food_cost{100.0f};
  float pupa_food_cost{150.0f};
  int max_emerge_per_tick{2};

  float relief_threshold{10.0f};
  float relief_energy{10.0f};
  float relief_interval_sec{10.0f};

  float evolve_cost_step{1.0f};
  std::size_t evolve_population_step{5};
};

// Nest: owns the roster, the larder and the brood pipeline.
class Colony final {
public:
  Colony(Vec2 center, const ColonyTuning& tuning, const AntTuning& ant_tuning);

  [[nodiscard]] Vec2 center() const noexcept { return center_; }
  [[nodiscard]] const ColonyTuning& tuning() const noexcept { return tuning_; }

  // ---- Roster --------------------------------------------------------------
  // Pays the spawn cost. nullptr, with nothing changed, when at the cap or short of food.
  // The pointer is valid until the next spawn or sweep.
  Ant* spawn_ant(SimulationContext& ctx);

  [[nodiscard]] Ant* try_get(AntId id);
  [[nodiscard]] const Ant* try_get(AntId id) const;
  [[nodiscard]] std::span<Ant> ants() { return ants_; }
  [[nodiscard]] std::span<const Ant> ants() const { return ants_; }

  // Live ants only; the roster may still hold ants killed since the last sweep.
  [[nodiscard]] std::size_t population() const noexcept;
  [[nodiscard]] std::size_t roster_size() const noexcept { return ants_.size(); }
  [[nodiscard]] bool soldiers_alive() const noexcept;
  [[nodiscard]] std::array<std::size_t, kAntStateCount> count_by_state() const noexcept;

  // Step 2 of the tick.
  void update_ants(float dt_sec, SimulationContext& ctx);

  // Step 3: sweep the dead, periodic spawn, queen cycle, brood, relief.
  void reconcile(float dt_sec, SimulationContext& ctx);

  // Removes dead ants, counting them. Returns how many went.
  std::size_t sweep_dead(SimulationContext& ctx);

  void reset_all_to_exploring(SimulationContext& ctx);

  // ---- Larder --------------------------------------------------------------
  [[nodiscard]] float food_storage() const noexcept { return food_storage_; }
  void add_food(float amount) noexcept;
  // Takes up to `amount`; storage never goes negative. Returns what was taken.
  float take_food(float amount) noexcept;
  void set_food_storage(float amount) noexcept;

  // ---- Growth --------------------------------------------------------------
  [[nodiscard]] std::size_t max_population() const noexcept { return max_population_; }
  [[nodiscard]] float spawn_cost() const noexcept { return spawn_cost_; }
  [[nodiscard]] std::uint32_t generation() const noexcept { return generation_; }
  [[nodiscard]] std::uint32_t total_born() const noexcept { return total_born_; }
  [[nodiscard]] std::uint32_t total_died() const noexcept { return total_died_; }

  // (born - died) / born, 1 before anyone is born.
  [[nodiscard]] float efficiency() const noexcept;

  // Generation +1, cheaper spawns, roomier cap.
  void evolve() noexcept;

  // ---- Reproduction --------------------------------------------------------
  [[nodiscard]] bool has_queen() const noexcept { return has_queen_; }
  [[nodiscard]] FlightState flight_state() const noexcept { return flight_; }
  [[nodiscard]] const BroodStages& brood() const noexcept { return brood_; }
  [[nodiscard]] std::uint32_t emerged() const noexcept { return emerged_; }

  void add_eggs(std::uint32_t count) noexcept { brood_.eggs += count; }

  // Showcase colonies neither spawn on their own nor breed.
  void set_showcase(bool showcase) noexcept { showcase_ = showcase; }
  [[nodiscard]] bool showcase() const noexcept { return showcase_; }

private:
  Vec2 center_{};
  ColonyTuning tuning_{};
  AntTuning ant_tuning_{};

  std::vector<Ant> ants_{};
  std::unordered_map<AntId, std::size_t> index_by_id_{};
  AntId next_id_{1};

  float food_storage_{0.0f};
  std::size_t max_population_{0};
  float spawn_cost_{0.0f};
  std::uint32_t generation_{1};
  std::uint32_t total_born_{0};
  std::uint32_t total_died_{0};
  float spawn_timer_sec_{0.0f};
  float relief_cooldown_sec_{0.0f};
  bool showcase_{false};

  bool has_queen_{false};
  FlightState flight_{FlightState::Idle};
  float flight_timer_sec_{0.0f};
  float phase_timer_sec_{0.0f};

  BroodStages brood_{};
  std::uint32_t emerged_{0};

  Ant* spawn(SimulationContext& ctx, bool pay);
  void update_queen_cycle(float dt_sec, SimulationContext& ctx);
  void update_brood(float dt_sec, SimulationContext& ctx);
  void apply_relief(float dt_sec);
  void on_queen_lost(SimulationContext& ctx);
};

} // namespace antsim::sim
