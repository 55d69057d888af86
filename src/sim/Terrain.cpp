#include "Terrain.hpp"

#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace antsim::sim {

std::optional<Environment> environment_from_string(std::string_view s) noexcept {
  if (s == "mixed") return Environment::Mixed;
  if (s == "grass") return Environment::Grass;
  if (s == "dry_soil") return Environment::DrySoil;
  if (s == "mud") return Environment::Mud;
  return std::nullopt;
}

TerrainGrid::TerrainGrid(const Bounds& bounds, Environment environment, core::Rng& rng, float cell_size)
    : bounds_(bounds), cell_size_(cell_size) {
  if (!(bounds.width() > 0.0f) || !(bounds.height() > 0.0f)) {
    throw std::invalid_argument("TerrainGrid: world bounds must have a positive area");
  }
  if (!(cell_size > 0.0f)) {
    throw std::invalid_argument("TerrainGrid: cell size must be positive");
  }

  cols_ = static_cast<int>(std::ceil(bounds.width() / cell_size_));
  rows_ = static_cast<int>(std::ceil(bounds.height() / cell_size_));
  regenerate(environment, rng);
}

void TerrainGrid::regenerate(Environment environment, core::Rng& rng) {
  environment_ = environment;
  cells_.assign(static_cast<std::size_t>(cols_) * static_cast<std::size_t>(rows_), TerrainKind::DrySoil);

  for (TerrainKind& cell : cells_) {
    switch (environment) {
      case Environment::Grass:   cell = TerrainKind::Grass; break;
      case Environment::DrySoil: cell = TerrainKind::DrySoil; break;
      case Environment::Mud:     cell = TerrainKind::Mud; break;
      case Environment::Mixed:
      default: {
        const float r = rng.next_float01();
        if (r < 0.4f) cell = TerrainKind::Grass;
        else if (r < 0.7f) cell = TerrainKind::DrySoil;
        else cell = TerrainKind::Mud;
        break;
      }
    }
  }

  spdlog::debug("TerrainGrid: {}x{} cells, environment '{}' (grass={}, dry={}, mud={})",
                cols_, rows_, to_string(environment), count(TerrainKind::Grass),
                count(TerrainKind::DrySoil), count(TerrainKind::Mud));
}

TerrainKind TerrainGrid::kind_at(Vec2 pos) const noexcept {
  const Vec2 p = bounds_.clamp(pos);
  const int cx = std::clamp(static_cast<int>((p.x - bounds_.min_x) / cell_size_), 0, cols_ - 1);
  const int cy = std::clamp(static_cast<int>((p.y - bounds_.min_y) / cell_size_), 0, rows_ - 1);
  return cells_[static_cast<std::size_t>(cy) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(cx)];
}

float TerrainGrid::speed_modifier_at(Vec2 pos, Weather weather) const {
  const float base = base_modifier(kind_at(pos));
  return weather == Weather::Rain ? base * kRainMultiplier : base;
}

std::size_t TerrainGrid::count(TerrainKind kind) const noexcept {
  return static_cast<std::size_t>(std::count(cells_.begin(), cells_.end(), kind));
}

} // namespace antsim::sim
