#pragma once

#include "SimTypes.hpp"

namespace antsim::sim {

// Host service the core reads the world through. The default implementation
// is TerrainGrid; tests substitute flat worlds.
class WorldQuery {
public:
  virtual ~WorldQuery() = default;

  // Movement multiplier at `pos` for the current weather (1.0 = unhindered).
  [[nodiscard]] virtual float speed_modifier_at(Vec2 pos, Weather weather) const = 0;

  [[nodiscard]] virtual Bounds bounds() const = 0;
};

// Uniform world with a constant modifier.
class FlatWorld final : public WorldQuery {
public:
  explicit FlatWorld(Bounds bounds = {}, float modifier = 1.0f) : bounds_(bounds), modifier_(modifier) {}

  [[nodiscard]] float speed_modifier_at(Vec2, Weather) const override { return modifier_; }
  [[nodiscard]] Bounds bounds() const override { return bounds_; }

private:
  Bounds bounds_{};
  float modifier_{1.0f};
};

} // namespace antsim::sim
