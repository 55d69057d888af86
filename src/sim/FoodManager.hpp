#pragma once

#include "SimTypes.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

class FoodSource final {
public:
  FoodSource(FoodId id, Vec2 position, float amount);

  [[nodiscard]] FoodId id() const noexcept { return id_; }
  [[nodiscard]] Vec2 position() const noexcept { return position_; }
  [[nodiscard]] float amount() const noexcept { return amount_; }
  [[nodiscard]] float max_amount() const noexcept { return max_amount_; }
  [[nodiscard]] bool active() const noexcept { return active_; }
  [[nodiscard]] bool depleted() const noexcept { return !active_ || amount_ <= 0.0f; }
  [[nodiscard]] bool in_grace_window() const noexcept { return grace_remaining_sec_ > 0.0f; }

  // Removes up to `requested` food and returns what was actually taken.
  float collect(float requested);

  // Termites destroy a source outright.
  void destroy();

  // Advances the near-empty grace window. Returns true if this call depleted the source.
  bool tick(float dt_sec);

  static constexpr float kNearEmptyAmount = 1.0f;
  static constexpr float kGraceWindowSec = 5.0f;

private:
  FoodId id_{kInvalidId};
  Vec2 position_{};
  float amount_{0.0f};
  float max_amount_{0.0f};
  bool active_{true};
  float grace_remaining_sec_{0.0f};

  void deplete() noexcept;
};

struct FoodStats {
  std::size_t total_sources{0};
  std::size_t active_sources{0};
  float total_collected{0.0f};
  float total_remaining{0.0f};
};

// Owns every food source. Depleted sources stay addressable until the next update().
class FoodManager final {
public:
  FoodManager() = default;

  FoodId create(Vec2 position, float amount);

  // Scatters `count` sources with 50..200 food, keeping clear of `colony` by `min_colony_distance`.
  void create_random(std::size_t count, const Bounds& bounds, Vec2 colony, core::Rng& rng,
                     float min_colony_distance = 100.0f);

  // Ticks grace windows and drops depleted sources, returning what was dropped.
  std::vector<FoodSource> update(float dt_sec);

  [[nodiscard]] FoodSource* try_get(FoodId id);
  [[nodiscard]] const FoodSource* try_get(FoodId id) const;

  // Nearest active source strictly closer than `max_distance`.
  [[nodiscard]] FoodSource* nearest_active(Vec2 pos, float max_distance);
  [[nodiscard]] std::vector<FoodId> in_radius(Vec2 pos, float radius) const;

  void add_collected(float amount) noexcept { total_collected_ += amount; }

  [[nodiscard]] std::span<FoodSource> sources() { return sources_; }
  [[nodiscard]] std::span<const FoodSource> sources() const { return sources_; }
  [[nodiscard]] FoodStats stats() const;

  void clear();

private:
  std::vector<FoodSource> sources_{};
  FoodId next_id_{1};
  float total_collected_{0.0f};
};

} // namespace antsim::sim
