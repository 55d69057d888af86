#pragma once

#include "SimTypes.hpp"
#include "SpatialHash2D.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace antsim::sim {

struct PheromoneDeposit {
  DepositId id{kInvalidId};
  Vec2 position{};
  PheromoneType type{PheromoneType::Exploration};

  float intensity{0.0f};
  float base_intensity{0.0f}; // intensity at creation, after the type multiplier
  float age_sec{0.0f};

  std::uint32_t follower_count{0}; // FoodTrail only
};

struct PheromoneHit {
  DepositId id{kInvalidId};
  Vec2 position{};
  PheromoneType type{PheromoneType::Exploration};
  float intensity{0.0f};
  float distance{0.0f};
};

struct PheromoneTuning {
  float cell_size{20.0f};
  std::size_t max_deposits{2000};
  float max_danger_share{0.5f}; // Danger stops being protected from eviction past this share

  float decay_rate{1.0f};          // per second, exponential types
  float removal_threshold{0.01f};

  float food_trail_max_age_sec{15.0f};
  TrailDecay food_trail_decay{TrailDecay::Linear};
  float follower_bonus_per_ant{0.5f};
  float follower_bonus_cap{2.0f};

  // Type multipliers and caps applied on deposit.
  float danger_multiplier{3.0f};
  float danger_cap{5.0f};
  float food_trail_multiplier{2.5f};
  float food_trail_deposit_cap{3.0f};
  float food_trail_cap{5.0f}; // live cap including the follower bonus
  float exploration_cap{5.0f};
};

inline constexpr float kMinDecayRate = 0.1f;
inline constexpr float kMaxDecayRate = 100.0f;

// Spatially hashed, typed, decaying scent map. Owns every deposit.
class PheromoneField final {
public:
  PheromoneField();
  explicit PheromoneField(const PheromoneTuning& tuning);

  [[nodiscard]] const PheromoneTuning& tuning() const noexcept { return tuning_; }
  void set_decay_rate(float rate) noexcept;
  void set_food_trail_decay(TrailDecay curve) noexcept { tuning_.food_trail_decay = curve; }

  // Applies the type multiplier and cap, stores and indexes the deposit.
  // Returns kInvalidId for non-positive or non-finite intensities.
  DepositId deposit(Vec2 pos, PheromoneType type, float base_intensity);

  // Ages every deposit, applies decay and drops expired ones.
  void tick(float dt_sec);

  [[nodiscard]] std::optional<PheromoneHit> find_strongest(
      Vec2 pos, float radius, std::optional<PheromoneType> type = std::nullopt,
      DepositId exclude = kInvalidId) const;

  [[nodiscard]] std::vector<PheromoneHit> find_in_radius(
      Vec2 pos, float radius, std::optional<PheromoneType> type = std::nullopt) const;

  [[nodiscard]] float density_at(Vec2 pos, float radius,
                                 std::optional<PheromoneType> type = std::nullopt) const;

  void add_follower(DepositId id);
  void remove_follower(DepositId id);

  [[nodiscard]] const PheromoneDeposit* try_get(DepositId id) const;
  [[nodiscard]] bool contains(DepositId id) const { return index_by_id_.count(id) != 0; }

  [[nodiscard]] std::size_t size() const noexcept { return deposits_.size(); }
  [[nodiscard]] std::size_t count(PheromoneType type) const noexcept;
  [[nodiscard]] std::array<std::size_t, kPheromoneTypeCount> counts_by_type() const noexcept;
  [[nodiscard]] std::span<const PheromoneDeposit> deposits() const { return deposits_; }
  [[nodiscard]] const SpatialHash2D& grid() const noexcept { return grid_; }

  void clear();

private:
  PheromoneTuning tuning_{};
  std::vector<PheromoneDeposit> deposits_{};
  std::unordered_map<DepositId, std::size_t> index_by_id_{};
  SpatialHash2D grid_{};
  DepositId next_id_{1};

  [[nodiscard]] float decayed_intensity(const PheromoneDeposit& d) const noexcept;
  [[nodiscard]] bool is_expired(const PheromoneDeposit& d) const noexcept;

  void remove_index_at(std::size_t idx);
  void enforce_capacity();

  template <class Fn>
  void for_each_in_radius(Vec2 pos, float radius, std::optional<PheromoneType> type, Fn&& fn) const;
};

} // namespace antsim::sim
