#pragma once

#include "SimTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

class Ant;
class PheromoneField;

struct Puddle {
  PuddleId id{kInvalidId};
  Vec2 position{};
  float radius{40.0f};
  std::uint32_t death_count{0};

  [[nodiscard]] bool contains(Vec2 p) const noexcept { return distance(p, position) <= radius; }
};

struct HazardTuning {
  float min_radius{30.0f};
  float max_radius{50.0f};
  std::size_t max_puddles{10};
  float min_colony_distance{150.0f};
  float spawn_rate_per_sec{0.06f};

  // Exposure model, read by ants.
  float penalty_exposure_sec{2.0f};
  float lethal_exposure_sec{5.0f};
  float warning_fraction{0.6f};

  // Danger burst.
  float burst_radius{80.0f};
  std::uint32_t burst_per_death{8};
  std::uint32_t burst_max_count{30};
  float burst_strength{2.0f};
  float burst_max_intensity{4.0f};
  float drowning_mark_intensity{4.0f};
};

struct HazardStats {
  std::size_t total_puddles{0};
  std::uint32_t total_deaths{0};
};

// Static circular puddles. Ants that linger drown; deaths turn into Danger scent.
class HazardField final {
public:
  HazardField() = default;
  explicit HazardField(const HazardTuning& tuning) : tuning_(tuning) {}

  [[nodiscard]] const HazardTuning& tuning() const noexcept { return tuning_; }

  PuddleId create(Vec2 position, float radius);

  // Places up to `count` puddles with random radii, away from the colony.
  // Returns the ids that were placed; a spot is skipped after 50 failed attempts.
  std::vector<PuddleId> spawn_random(std::size_t count, const Bounds& bounds, Vec2 colony, core::Rng& rng);

  // Rolls the per-second spawn rate for this step. Returns the new puddle, if any.
  std::optional<PuddleId> maybe_spawn(float dt_sec, const Bounds& bounds, Vec2 colony, core::Rng& rng);

  // First puddle containing `p`.
  [[nodiscard]] const Puddle* puddle_at(Vec2 p) const;
  [[nodiscard]] const Puddle* try_get(PuddleId id) const;

  // Burst of Danger deposits around `center`, sized by `death_count`.
  // Returns the number of deposits placed.
  std::size_t release_danger(Vec2 center, std::uint32_t death_count, PheromoneField& pheromones,
                             core::Rng& rng) const;

  // Records a drowning in `puddle` and marks the spot.
  void on_ant_drowned(PuddleId puddle, Vec2 death_position, PheromoneField& pheromones, core::Rng& rng);

  // Exposure warnings: each ant past the warning threshold bursts once per exposure episode.
  void update(std::span<Ant> ants, PheromoneField& pheromones, core::Rng& rng);

  [[nodiscard]] std::span<const Puddle> puddles() const { return puddles_; }
  [[nodiscard]] std::size_t size() const noexcept { return puddles_.size(); }
  [[nodiscard]] HazardStats stats() const;

  [[nodiscard]] static constexpr std::uint32_t burst_count(std::uint32_t death_count,
                                                           const HazardTuning& t) noexcept {
    const std::uint32_t n = death_count * t.burst_per_death;
    return n < t.burst_max_count ? n : t.burst_max_count;
  }

  [[nodiscard]] static constexpr float burst_intensity(std::uint32_t death_count,
                                                       const HazardTuning& t) noexcept {
    const float s = t.burst_strength * (static_cast<float>(death_count) / 3.0f);
    return s < t.burst_max_intensity ? s : t.burst_max_intensity;
  }

  void clear();

private:
  HazardTuning tuning_{};
  std::vector<Puddle> puddles_{};
  PuddleId next_id_{1};

  Puddle* find(PuddleId id);
};

} // namespace antsim::sim
