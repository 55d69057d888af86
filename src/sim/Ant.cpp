#include "Ant.hpp"

#include "Colony.hpp"
#include "Corpses.hpp"
#include "FoodManager.hpp"
#include "HazardField.hpp"
#include "PheromoneField.hpp"
#include "SimEvents.hpp"
#include "SimulationContext.hpp"
#include "Termite.hpp"
#include "WorldQuery.hpp"
#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace antsim::sim {

Ant::Ant(AntId id, AntRole role, Vec2 position, const AntTuning& tuning, core::Rng& rng)
    : id_(id),
      role_(role),
      position_(position),
      home_(position),
      heading_(rng.uniform(0.0f, kTwoPi)),
      energy_(tuning.max_energy),
      max_energy_(tuning.max_energy),
      max_carry_(tuning.max_carry) {
  wander_angle_ = heading_;
  base_speed_ = rng.uniform(tuning.min_speed, tuning.max_speed);
  speed_ = base_speed_;
}

void Ant::update(float dt_sec, SimulationContext& ctx) {
  if (dead_) return;
  const AntTuning& t = ctx.ant_tuning;

  lifespan_sec_ += dt_sec;
  energy_ -= t.energy_drain_per_sec * dt_sec;
  if (energy_ <= 0.0f) {
    die(DeathCause::Starvation, ctx);
    return;
  }

  update_hazard(dt_sec, ctx);
  if (dead_) return;

  if (state_ == AntState::Resting) {
    rest_remaining_sec_ -= dt_sec;
    if (rest_remaining_sec_ > 0.0f) return;
    rest_remaining_sec_ = 0.0f;
    state_ = AntState::Exploring;
    return;
  }

  moving_ = true;

  const AntMind mind{role_, state_, carrying_food_, carrying_corpse_, target_, is_valid(target_, ctx)};
  apply(decide(mind, perceive(ctx)), ctx);

  switch (state_) {
    case AntState::Exploring:        explore(ctx.rng, t); break;
    case AntState::SeekingFood:      seek_food(ctx); break;
    case AntState::ReturningHome:    return_home(ctx); break;
    case AntState::FollowingTrail:   follow_trail(ctx); break;
    case AntState::AttackingTermite: attack_termite(ctx); break;
    case AntState::Hiding:           hide(ctx); break;
    case AntState::FeedingBrood:     feed_brood(ctx); break;
    case AntState::CollectingCorpse: collect_corpse(ctx); break;
    case AntState::AvoidingDanger:   break; // heading set by apply()
    case AntState::Resting:
    default:                         break;
  }

  if (dead_ || state_ == AntState::Resting) return;

  emit_pheromones(dt_sec, ctx);
  move(dt_sec, ctx);
}

AntPerception Ant::perceive(const SimulationContext& ctx) const {
  const AntTuning& t = ctx.ant_tuning;

  AntPerception seen{};
  seen.attack_active = ctx.attack_active;

  if (ctx.attack_active && role_ == AntRole::Soldier) {
    if (const Termite* tm = ctx.termites.nearest_alive(position_, t.termite_sense)) {
      seen.termite = Sighting<TermiteId>{tm->id(), tm->position(), distance(position_, tm->position())};
    }
  }

  if (const Corpse* c = ctx.corpses.nearest(position_, t.corpse_sense)) {
    seen.corpse = Sighting<CorpseId>{c->id, c->position, distance(position_, c->position)};
  }

  if (const auto hit = ctx.pheromones.find_strongest(position_, t.danger_sense, PheromoneType::Danger)) {
    seen.danger = Sighting<DepositId>{hit->id, hit->position, hit->distance};
  }

  if (const auto hit = ctx.pheromones.find_strongest(position_, t.trail_sense, PheromoneType::FoodTrail)) {
    seen.trail = Sighting<DepositId>{hit->id, hit->position, hit->distance};
  }

  if (const FoodSource* f = ctx.food.nearest_active(position_, t.food_sense)) {
    seen.food = Sighting<FoodId>{f->id(), f->position(), distance(position_, f->position())};
  }

  return seen;
}

void Ant::apply(const AntDecision& decision, SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;
  const AntState previous = state_;

  retarget(decision.target, ctx);
  state_ = decision.state;

  if (decision.reset_speed || (previous == AntState::AvoidingDanger && !decision.flee)) {
    speed_ = base_speed_;
  }

  if (decision.flee) {
    if (previous != AntState::AvoidingDanger) {
      flee_jitter_ = ctx.rng.uniform(-t.flee_jitter_rad, t.flee_jitter_rad);
      speed_ = std::min(base_speed_ * t.flee_speed_multiplier, t.flee_speed_cap);
    }
    // Standing on the deposit: keep going the way we came from.
    heading_ = bearing(decision.flee_from, position_, heading_ + kPi) + flee_jitter_;
  }
}

void Ant::retarget(Target next, SimulationContext& ctx) {
  const DepositId old_trail = trail_of(target_);
  const DepositId new_trail = trail_of(next);
  if (old_trail != new_trail) {
    if (old_trail != kInvalidId) ctx.pheromones.remove_follower(old_trail);
    if (new_trail != kInvalidId) ctx.pheromones.add_follower(new_trail);
  }
  target_ = next;
}

void Ant::update_hazard(float dt_sec, SimulationContext& ctx) {
  const Puddle* puddle = ctx.hazards.puddle_at(position_);
  if (!puddle) {
    hazard_exposure_sec_ = 0.0f;
    hazard_penalized_ = false;
    hazard_warned_ = false;
    return;
  }

  const HazardTuning& h = ctx.hazards.tuning();
  hazard_exposure_sec_ += dt_sec;

  if (!hazard_penalized_ && hazard_exposure_sec_ >= h.penalty_exposure_sec) {
    energy_ *= 0.5f;
    hazard_penalized_ = true;
  }

  if (hazard_exposure_sec_ >= h.lethal_exposure_sec) {
    const PuddleId puddle_id = puddle->id;
    die(DeathCause::Hazard, ctx);
    ctx.hazards.on_ant_drowned(puddle_id, position_, ctx.pheromones, ctx.rng);
  }
}

void Ant::explore(core::Rng& rng, const AntTuning& t) {
  wander_angle_ += (rng.next_float01() - 0.5f) * t.wander_jitter;
  heading_ = wander_angle_ + rng.uniform(-t.heading_jitter, t.heading_jitter);
}

void Ant::seek_food(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  const auto* ref = std::get_if<FoodRef>(&target_);
  FoodSource* food = ref ? ctx.food.try_get(ref->id) : nullptr;
  if (!food || food->depleted()) {
    retarget({}, ctx);
    state_ = AntState::Exploring;
    return;
  }

  if (distance(position_, food->position()) >= t.collect_radius) {
    steer_to(food->position());
    return;
  }

  const float taken = food->collect(max_carry_ - food_amount_);
  if (taken > 0.0f) {
    food_amount_ += taken;
    ctx.food.add_collected(taken);
  }

  if (food_amount_ >= max_carry_) {
    food_amount_ = max_carry_;
    carrying_food_ = true;
    retarget({}, ctx);
  } else if (t.carry_mode == CarryMode::AnyAmount && food_amount_ > 0.0f) {
    carrying_food_ = true;
  }

  if (food->depleted()) retarget({}, ctx);
}

void Ant::return_home(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  if (distance(position_, home_) >= t.home_radius) {
    steer_to(home_);
    return;
  }

  if (carrying_food_) {
    ctx.colony.add_food(food_amount_);
    food_collected_ += food_amount_;
    food_amount_ = 0.0f;
    carrying_food_ = false;
    add_energy(t.home_energy_gain);
    start_resting(ctx.rng);
  } else if (carrying_corpse_) {
    carrying_corpse_ = false;
    start_resting(ctx.rng);
  } else {
    state_ = AntState::Exploring;
  }
}

void Ant::follow_trail(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  const DepositId current = trail_of(target_);
  const PheromoneDeposit* deposit = current != kInvalidId ? ctx.pheromones.try_get(current) : nullptr;
  if (!deposit) {
    retarget({}, ctx);
    state_ = AntState::Exploring;
    return;
  }

  if (distance(position_, deposit->position) >= t.trail_arrival_radius) {
    steer_to(deposit->position);
    return;
  }

  // Trails lead away from the nest; never step back to a deposit nearer home.
  const float reached = distance(deposit->position, home_);
  std::optional<PheromoneHit> next;
  float best_score = 0.0f;
  for (const PheromoneHit& hit :
       ctx.pheromones.find_in_radius(position_, t.next_trail_radius, PheromoneType::FoodTrail)) {
    if (hit.id == current || distance(hit.position, home_) < reached) continue;
    const float score = hit.intensity * (1.0f - hit.distance / t.next_trail_radius);
    if (score > best_score) {
      best_score = score;
      next = hit;
    }
  }

  if (next) {
    retarget(PheromoneRef{next->id}, ctx);
    steer_to(next->position);
    return;
  }

  if (const FoodSource* food = ctx.food.nearest_active(position_, t.food_sense)) {
    retarget(FoodRef{food->id()}, ctx);
    state_ = AntState::SeekingFood;
    steer_to(food->position());
    return;
  }

  retarget({}, ctx);
  state_ = AntState::Exploring;
}

void Ant::attack_termite(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  const auto* ref = std::get_if<TermiteRef>(&target_);
  Termite* termite = ref ? ctx.termites.try_get(ref->id) : nullptr;
  if (!termite || !termite->alive()) {
    retarget({}, ctx);
    state_ = AntState::Exploring;
    return;
  }

  if (distance(position_, termite->position()) >= t.attack_range) {
    steer_to(termite->position());
    return;
  }

  termite->take_damage(t.attack_damage);
  energy_ = std::max(0.0f, energy_ - t.attack_energy_cost);
  if (energy_ <= 0.0f) die(DeathCause::Exhaustion, ctx);
}

void Ant::hide(SimulationContext& ctx) {
  const Vec2 nest = ctx.colony.center();
  if (distance(position_, nest) > ctx.ant_tuning.hide_radius) {
    steer_to(nest);
  } else {
    moving_ = false;
  }
}

void Ant::feed_brood(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  if (role_ != AntRole::Nurse && !ctx.rng.chance(t.feed_chance)) {
    state_ = AntState::Exploring;
    return;
  }

  fed_brood_ = true;
  energy_ = std::max(0.0f, energy_ - t.feed_energy_cost);
  if (energy_ <= 0.0f) {
    die(DeathCause::Exhaustion, ctx);
    return;
  }
  start_resting(ctx.rng);
}

void Ant::collect_corpse(SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  const auto* ref = std::get_if<CorpseRef>(&target_);
  const Corpse* corpse = ref ? ctx.corpses.try_get(ref->id) : nullptr;
  if (!corpse || corpse->collected) {
    retarget({}, ctx);
    state_ = AntState::Exploring;
    return;
  }

  if (distance(position_, corpse->position) >= t.corpse_pickup_radius) {
    steer_to(corpse->position);
    return;
  }

  const CorpseId corpse_id = corpse->id;
  if (ctx.corpses.collect(corpse_id)) {
    ++corpses_collected_;
    carrying_corpse_ = true;
    ctx.events.enqueue(evt::CorpseCollected{corpse_id, id_});
  }
  retarget({}, ctx);
  state_ = AntState::ReturningHome;
  steer_to(home_);
}

void Ant::steer_to(Vec2 p) noexcept {
  heading_ = bearing(position_, p, heading_);
}

void Ant::emit_pheromones(float dt_sec, SimulationContext& ctx) {
  const AntTuning& t = ctx.ant_tuning;

  pheromone_timer_sec_ += dt_sec;
  if (pheromone_timer_sec_ < t.pheromone_interval_sec) return;
  pheromone_timer_sec_ = 0.0f;

  if (carrying_food_) {
    const float fullness = food_amount_ / max_carry_;
    ctx.pheromones.deposit(position_, PheromoneType::FoodTrail, fullness);

    if (t.trail_clusters && fullness >= t.cluster_threshold) {
      for (int i = 0; i < t.cluster_size; ++i) {
        const Vec2 offset{ctx.rng.uniform(-t.cluster_spread, t.cluster_spread),
                          ctx.rng.uniform(-t.cluster_spread, t.cluster_spread)};
        ctx.pheromones.deposit(position_ + offset, PheromoneType::FoodTrail, t.cluster_intensity);
      }
    }
  } else if (state_ == AntState::Exploring) {
    ctx.pheromones.deposit(position_, PheromoneType::Exploration, t.exploration_intensity);
  }
}

void Ant::move(float dt_sec, SimulationContext& ctx) {
  if (!moving_) return;
  const AntTuning& t = ctx.ant_tuning;

  const float variation = ctx.rng.uniform(t.min_speed_variation, t.max_speed_variation);
  const float terrain = ctx.world.speed_modifier_at(position_, ctx.weather);

  position_ += from_angle(heading_) * (speed_ * variation * terrain * dt_sec);
  position_ = ctx.world.bounds().clamp(position_);
}

void Ant::add_energy(float amount) noexcept {
  if (dead_ || !(amount > 0.0f)) return;
  energy_ = std::min(max_energy_, energy_ + amount);
}

void Ant::take_damage(float amount, SimulationContext& ctx) {
  if (dead_ || !(amount > 0.0f)) return;
  energy_ = std::max(0.0f, energy_ - amount);
  if (energy_ <= 0.0f) die(DeathCause::Combat, ctx);
}

void Ant::start_resting(core::Rng& rng) {
  const bool fed = fed_brood_;
  fed_brood_ = false;

  rest_remaining_sec_ = fed ? rng.uniform(4.0f, 7.0f) : rng.uniform(3.0f, 5.0f);
  state_ = AntState::Resting;
  moving_ = false;
}

void Ant::reset_to_exploring(SimulationContext& ctx) {
  if (dead_) return;
  retarget({}, ctx);
  state_ = AntState::Exploring;
  rest_remaining_sec_ = 0.0f;
  speed_ = base_speed_;
  moving_ = true;
}

void Ant::die(DeathCause cause, SimulationContext& ctx) {
  if (dead_) return;

  dead_ = true;
  death_cause_ = cause;
  energy_ = 0.0f;
  retarget({}, ctx);
  food_amount_ = 0.0f;
  carrying_food_ = false;
  carrying_corpse_ = false;

  ctx.corpses.add(position_, role_);
  ctx.events.enqueue(evt::AntDied{id_, role_, position_, cause});

  spdlog::debug("Ant {} ({}) died of {} at ({:.0f}, {:.0f}) after {:.1f}s", id_, to_string(role_),
                to_string(cause), position_.x, position_.y, lifespan_sec_);
}

void Ant::set_state(AntState s, Target t, SimulationContext& ctx) {
  retarget(t, ctx);
  state_ = s;
}

void Ant::set_carried_food(float amount) noexcept {
  food_amount_ = std::clamp(amount, 0.0f, max_carry_);
  carrying_food_ = food_amount_ > 0.0f;
}

} // namespace antsim::sim
