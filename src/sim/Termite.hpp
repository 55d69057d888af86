#pragma once

#include "SimTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

struct SimulationContext;

struct TermiteTuning {
  float max_health{50.0f};
  float damage{10.0f};
  float attack_range{15.0f};
  float colony_hitbox{30.0f}; // added to attack_range against the nest
  float attack_cooldown_sec{1.0f};
  float min_speed{60.0f};
  float max_speed{80.0f};

  float food_sense{200.0f};
  float colony_sense{150.0f};
  float ant_sense{100.0f};              // no soldiers left
  float ant_sense_with_soldiers{50.0f}; // non-soldiers only

  float approach_jitter{0.25f};
  float approach_until{50.0f};
  float wander_jitter{0.4f};
  float spawn_margin{20.0f};
};

class Termite final {
public:
  Termite(TermiteId id, Vec2 position, const TermiteTuning& tuning, core::Rng& rng);

  void update(float dt_sec, SimulationContext& ctx, const TermiteTuning& tuning);

  [[nodiscard]] TermiteId id() const noexcept { return id_; }
  [[nodiscard]] Vec2 position() const noexcept { return position_; }
  [[nodiscard]] float heading() const noexcept { return heading_; }
  [[nodiscard]] float speed() const noexcept { return speed_; }
  [[nodiscard]] float health() const noexcept { return health_; }
  [[nodiscard]] float max_health() const noexcept { return max_health_; }
  [[nodiscard]] bool alive() const noexcept { return health_ > 0.0f; }
  [[nodiscard]] TermiteState state() const noexcept { return state_; }
  // Food or ant id, depending on the state.
  [[nodiscard]] std::uint32_t target_id() const noexcept { return target_id_; }
  [[nodiscard]] float attack_cooldown_sec() const noexcept { return cooldown_sec_; }

  void take_damage(float amount) noexcept;

  void set_position(Vec2 p) noexcept { position_ = p; }

private:
  TermiteId id_{kInvalidId};
  Vec2 position_{};
  float heading_{0.0f};
  float wander_angle_{0.0f};
  float speed_{70.0f};
  float health_{50.0f};
  float max_health_{50.0f};
  TermiteState state_{TermiteState::Seeking};
  std::uint32_t target_id_{kInvalidId};
  float cooldown_sec_{0.0f};

  void choose_target(const SimulationContext& ctx, const TermiteTuning& t);
  void seek(SimulationContext& ctx, const TermiteTuning& t);
  void attack_food(SimulationContext& ctx, const TermiteTuning& t);
  void attack_colony(SimulationContext& ctx, const TermiteTuning& t);
  void attack_ant(SimulationContext& ctx, const TermiteTuning& t);
  [[nodiscard]] bool ready() const noexcept { return cooldown_sec_ <= 0.0f; }
};

// Raiding party. Dead termites are dropped at the end of each update.
class TermiteSwarm final {
public:
  TermiteSwarm() = default;
  explicit TermiteSwarm(const TermiteTuning& tuning) : tuning_(tuning) {}

  [[nodiscard]] const TermiteTuning& tuning() const noexcept { return tuning_; }

  TermiteId spawn(Vec2 position, core::Rng& rng);

  // `count` termites just outside random edges of `bounds`.
  void spawn_raid(std::size_t count, const Bounds& bounds, core::Rng& rng);

  void update(float dt_sec, SimulationContext& ctx);

  [[nodiscard]] Termite* try_get(TermiteId id);
  [[nodiscard]] const Termite* try_get(TermiteId id) const;

  [[nodiscard]] std::span<Termite> termites() { return termites_; }
  [[nodiscard]] std::span<const Termite> termites() const { return termites_; }
  [[nodiscard]] std::size_t size() const noexcept { return termites_.size(); }
  [[nodiscard]] bool empty() const noexcept { return termites_.empty(); }
  [[nodiscard]] std::size_t alive_count() const noexcept;

  // Nearest live termite strictly closer than `max_distance`.
  [[nodiscard]] const Termite* nearest_alive(Vec2 pos, float max_distance) const;

  void clear() { termites_.clear(); }

private:
  TermiteTuning tuning_{};
  std::vector<Termite> termites_{};
  TermiteId next_id_{1};
};

} // namespace antsim::sim
