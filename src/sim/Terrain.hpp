#pragma once

#include "WorldQuery.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

enum class TerrainKind : std::uint8_t {
  Grass   = 0,
  DrySoil = 1,
  Mud     = 2
};

// How a fresh grid is filled.
enum class Environment : std::uint8_t {
  Mixed   = 0, // 40 % grass, 30 % dry soil, 30 % mud
  Grass   = 1,
  DrySoil = 2,
  Mud     = 3
};

[[nodiscard]] constexpr std::string_view to_string(TerrainKind k) noexcept {
  switch (k) {
    case TerrainKind::Grass:   return "grass";
    case TerrainKind::DrySoil: return "dry_soil";
    case TerrainKind::Mud:     return "mud";
    default:                   return "unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(Environment e) noexcept {
  switch (e) {
    case Environment::Mixed:   return "mixed";
    case Environment::Grass:   return "grass";
    case Environment::DrySoil: return "dry_soil";
    case Environment::Mud:     return "mud";
    default:                   return "unknown";
  }
}

[[nodiscard]] std::optional<Environment> environment_from_string(std::string_view s) noexcept;

// Coarse terrain cells with per-kind movement modifiers.
class TerrainGrid final : public WorldQuery {
public:
  static constexpr float kDefaultCellSize = 100.0f;
  static constexpr float kRainMultiplier = 0.7f;

  // Throws std::invalid_argument for empty bounds or a non-positive cell size.
  TerrainGrid(const Bounds& bounds, Environment environment, core::Rng& rng,
              float cell_size = kDefaultCellSize);

  void regenerate(Environment environment, core::Rng& rng);

  [[nodiscard]] TerrainKind kind_at(Vec2 pos) const noexcept;
  [[nodiscard]] float speed_modifier_at(Vec2 pos, Weather weather) const override;
  [[nodiscard]] Bounds bounds() const override { return bounds_; }

  [[nodiscard]] int cols() const noexcept { return cols_; }
  [[nodiscard]] int rows() const noexcept { return rows_; }
  [[nodiscard]] float cell_size() const noexcept { return cell_size_; }
  [[nodiscard]] Environment environment() const noexcept { return environment_; }

  // Number of cells of the given kind.
  [[nodiscard]] std::size_t count(TerrainKind kind) const noexcept;

  [[nodiscard]] static constexpr float base_modifier(TerrainKind kind) noexcept {
    switch (kind) {
      case TerrainKind::Grass:   return 0.8f;
      case TerrainKind::DrySoil: return 1.0f;
      case TerrainKind::Mud:     return 0.6f;
      default:                   return 1.0f;
    }
  }

private:
  Bounds bounds_{};
  float cell_size_{kDefaultCellSize};
  int cols_{0};
  int rows_{0};
  Environment environment_{Environment::Mixed};
  std::vector<TerrainKind> cells_{};
};

} // namespace antsim::sim
