#include "HazardField.hpp"

#include "Ant.hpp"
#include "PheromoneField.hpp"
#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace antsim::sim {

PuddleId HazardField::create(Vec2 position, float radius) {
  const PuddleId id = next_id_++;
  puddles_.push_back(Puddle{id, position, radius, 0});
  return id;
}

std::vector<PuddleId> HazardField::spawn_random(std::size_t count, const Bounds& bounds, Vec2 colony,
                                                core::Rng& rng) {
  constexpr int kMaxAttempts = 50;

  std::vector<PuddleId> placed;
  for (std::size_t i = 0; i < count; ++i) {
    Vec2 p{};
    bool found = false;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
      p = {rng.uniform(bounds.min_x, bounds.max_x), rng.uniform(bounds.min_y, bounds.max_y)};
      if (distance(p, colony) >= tuning_.min_colony_distance) {
        found = true;
        break;
      }
    }
    if (!found) continue;

    placed.push_back(create(p, rng.uniform(tuning_.min_radius, tuning_.max_radius)));
  }
  return placed;
}

std::optional<PuddleId> HazardField::maybe_spawn(float dt_sec, const Bounds& bounds, Vec2 colony,
                                                 core::Rng& rng) {
  if (puddles_.size() >= tuning_.max_puddles) return std::nullopt;
  if (!rng.chance(tuning_.spawn_rate_per_sec * dt_sec)) return std::nullopt;

  const std::vector<PuddleId> placed = spawn_random(1, bounds, colony, rng);
  if (placed.empty()) return std::nullopt;
  return placed.front();
}

const Puddle* HazardField::puddle_at(Vec2 p) const {
  for (const Puddle& puddle : puddles_) {
    if (puddle.contains(p)) return &puddle;
  }
  return nullptr;
}

const Puddle* HazardField::try_get(PuddleId id) const {
  for (const Puddle& puddle : puddles_) {
    if (puddle.id == id) return &puddle;
  }
  return nullptr;
}

Puddle* HazardField::find(PuddleId id) {
  for (Puddle& puddle : puddles_) {
    if (puddle.id == id) return &puddle;
  }
  return nullptr;
}

std::size_t HazardField::release_danger(Vec2 center, std::uint32_t death_count, PheromoneField& pheromones,
                                        core::Rng& rng) const {
  const std::uint32_t n = burst_count(death_count, tuning_);
  const float strength = burst_intensity(death_count, tuning_);

  std::size_t placed = 0;
  for (std::uint32_t i = 0; i < n; ++i) {
    const float angle = kTwoPi * static_cast<float>(i) / static_cast<float>(n);
    const float r = rng.uniform(0.0f, tuning_.burst_radius);
    if (pheromones.deposit(center + from_angle(angle) * r, PheromoneType::Danger, strength) != kInvalidId) {
      ++placed;
    }
  }
  return placed;
}

void HazardField::on_ant_drowned(PuddleId puddle_id, Vec2 death_position, PheromoneField& pheromones,
                                 core::Rng& rng) {
  Puddle* puddle = find(puddle_id);
  if (!puddle) return;

  ++puddle->death_count;
  release_danger(puddle->position, puddle->death_count, pheromones, rng);
  pheromones.deposit(death_position, PheromoneType::Danger, tuning_.drowning_mark_intensity);

  spdlog::debug("HazardField: drowning in puddle {} at ({:.0f}, {:.0f}), deaths={}", puddle->id,
                puddle->position.x, puddle->position.y, puddle->death_count);
}

void HazardField::update(std::span<Ant> ants, PheromoneField& pheromones, core::Rng& rng) {
  const float warn_at = tuning_.lethal_exposure_sec * tuning_.warning_fraction;

  for (Ant& ant : ants) {
    if (!ant.alive() || ant.hazard_warned()) continue;
    if (ant.hazard_exposure_sec() < warn_at) continue;

    const Puddle* puddle = puddle_at(ant.position());
    if (!puddle) continue;

    // A puddle nobody has died in yet still warns as if this ant were the first.
    release_danger(puddle->position, std::max<std::uint32_t>(puddle->death_count, 1), pheromones, rng);
    ant.mark_hazard_warned();
  }
}

HazardStats HazardField::stats() const {
  HazardStats s{};
  s.total_puddles = puddles_.size();
  for (const Puddle& p : puddles_) s.total_deaths += p.death_count;
  return s;
}

void HazardField::clear() {
  puddles_.clear();
}

} // namespace antsim::sim
