#include "Termite.hpp"

#include "Ant.hpp"
#include "Colony.hpp"
#include "FoodManager.hpp"
#include "SimulationContext.hpp"
#include "WorldQuery.hpp"
#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace antsim::sim {

namespace {

const Ant* nearest_ant(const Colony& colony, Vec2 pos, float max_distance, bool skip_soldiers) {
  const Ant* best = nullptr;
  float best_distance = max_distance;
  for (const Ant& ant : colony.ants()) {
    if (!ant.alive()) continue;
    if (skip_soldiers && ant.role() == AntRole::Soldier) continue;
    const float d = distance(ant.position(), pos);
    if (d < best_distance) {
      best_distance = d;
      best = &ant;
    }
  }
  return best;
}

} // namespace

Termite::Termite(TermiteId id, Vec2 position, const TermiteTuning& tuning, core::Rng& rng)
    : id_(id),
      position_(position),
      heading_(rng.uniform(0.0f, kTwoPi)),
      speed_(rng.uniform(tuning.min_speed, tuning.max_speed)),
      health_(tuning.max_health),
      max_health_(tuning.max_health) {
  wander_angle_ = heading_;
}

void Termite::update(float dt_sec, SimulationContext& ctx, const TermiteTuning& tuning) {
  cooldown_sec_ = std::max(0.0f, cooldown_sec_ - dt_sec);
  if (!alive()) return;

  choose_target(ctx, tuning);

  switch (state_) {
    case TermiteState::Seeking:         seek(ctx, tuning); break;
    case TermiteState::AttackingFood:   attack_food(ctx, tuning); break;
    case TermiteState::AttackingColony: attack_colony(ctx, tuning); break;
    case TermiteState::AttackingAnt:    attack_ant(ctx, tuning); break;
  }

  const float variation = ctx.rng.uniform(0.8f, 1.2f);
  position_ += from_angle(heading_) * (speed_ * variation * dt_sec);
  position_ = ctx.world.bounds().clamp(position_);
}

void Termite::choose_target(const SimulationContext& ctx, const TermiteTuning& t) {
  if (const FoodSource* food = ctx.food.nearest_active(position_, t.food_sense)) {
    state_ = TermiteState::AttackingFood;
    target_id_ = food->id();
    return;
  }

  if (distance(position_, ctx.colony.center()) < t.colony_sense) {
    state_ = TermiteState::AttackingColony;
    target_id_ = kInvalidId;
    return;
  }

  // Soldiers are expected to intercept, so only stray non-soldiers close by are worth a bite.
  const bool soldiers = ctx.colony.soldiers_alive();
  const float reach = soldiers ? t.ant_sense_with_soldiers : t.ant_sense;
  if (const Ant* ant = nearest_ant(ctx.colony, position_, reach, soldiers)) {
    state_ = TermiteState::AttackingAnt;
    target_id_ = ant->id();
    return;
  }

  state_ = TermiteState::Seeking;
  target_id_ = kInvalidId;
}

void Termite::seek(SimulationContext& ctx, const TermiteTuning& t) {
  const Vec2 nest = ctx.colony.center();
  if (distance(position_, nest) > t.approach_until) {
    heading_ = bearing(position_, nest, heading_) + ctx.rng.uniform(-t.approach_jitter, t.approach_jitter);
    return;
  }

  wander_angle_ += (ctx.rng.next_float01() - 0.5f) * t.wander_jitter;
  heading_ = wander_angle_;
}

void Termite::attack_food(SimulationContext& ctx, const TermiteTuning& t) {
  FoodSource* food = ctx.food.try_get(target_id_);
  if (!food || food->depleted()) {
    state_ = TermiteState::Seeking;
    return;
  }

  if (distance(position_, food->position()) >= t.attack_range) {
    heading_ = bearing(position_, food->position(), heading_);
    return;
  }

  if (!ready()) return;
  food->destroy();
  cooldown_sec_ = t.attack_cooldown_sec;
  spdlog::debug("Termite {} destroyed food source {}", id_, food->id());
}

void Termite::attack_colony(SimulationContext& ctx, const TermiteTuning& t) {
  const Vec2 nest = ctx.colony.center();
  if (distance(position_, nest) >= t.attack_range + t.colony_hitbox) {
    heading_ = bearing(position_, nest, heading_);
    return;
  }

  if (!ready()) return;
  ctx.colony.take_food(t.damage);
  cooldown_sec_ = t.attack_cooldown_sec;
}

void Termite::attack_ant(SimulationContext& ctx, const TermiteTuning& t) {
  Ant* ant = ctx.colony.try_get(target_id_);
  if (!ant || !ant->alive()) {
    state_ = TermiteState::Seeking;
    return;
  }

  if (distance(position_, ant->position()) >= t.attack_range) {
    heading_ = bearing(position_, ant->position(), heading_);
    return;
  }

  if (!ready()) return;
  ant->take_damage(t.damage, ctx);
  cooldown_sec_ = t.attack_cooldown_sec;
}

void Termite::take_damage(float amount) noexcept {
  if (!(amount > 0.0f)) return;
  health_ = std::max(0.0f, health_ - amount);
}

// ----------------------------------------------------------------------------
// TermiteSwarm
// ----------------------------------------------------------------------------
TermiteId TermiteSwarm::spawn(Vec2 position, core::Rng& rng) {
  const TermiteId id = next_id_++;
  termites_.emplace_back(id, position, tuning_, rng);
  return id;
}

void TermiteSwarm::spawn_raid(std::size_t count, const Bounds& bounds, core::Rng& rng) {
  const float m = tuning_.spawn_margin;
  for (std::size_t i = 0; i < count; ++i) {
    Vec2 p{};
    switch (rng.uniform_int(0, 3)) {
      case 0:  p = {rng.uniform(bounds.min_x, bounds.max_x), bounds.min_y - m}; break; // top
      case 1:  p = {bounds.max_x + m, rng.uniform(bounds.min_y, bounds.max_y)}; break; // right
      case 2:  p = {rng.uniform(bounds.min_x, bounds.max_x), bounds.max_y + m}; break; // bottom
      default: p = {bounds.min_x - m, rng.uniform(bounds.min_y, bounds.max_y)}; break; // left
    }
    spawn(p, rng);
  }
}

void TermiteSwarm::update(float dt_sec, SimulationContext& ctx) {
  for (Termite& termite : termites_) {
    termite.update(dt_sec, ctx, tuning_);
  }
  std::erase_if(termites_, [](const Termite& t) { return !t.alive(); });
}

Termite* TermiteSwarm::try_get(TermiteId id) {
  for (Termite& t : termites_) {
    if (t.id() == id) return &t;
  }
  return nullptr;
}

const Termite* TermiteSwarm::try_get(TermiteId id) const {
  for (const Termite& t : termites_) {
    if (t.id() == id) return &t;
  }
  return nullptr;
}

std::size_t TermiteSwarm::alive_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(termites_.begin(), termites_.end(), [](const Termite& t) { return t.alive(); }));
}

const Termite* TermiteSwarm::nearest_alive(Vec2 pos, float max_distance) const {
  const Termite* best = nullptr;
  float best_distance = max_distance;
  for (const Termite& t : termites_) {
    if (!t.alive()) continue;
    const float d = distance(t.position(), pos);
    if (d < best_distance) {
      best_distance = d;
      best = &t;
    }
  }
  return best;
}

} // namespace antsim::sim
