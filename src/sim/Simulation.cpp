#include "Simulation.hpp"

#include "SimEvents.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace antsim::sim {

Simulation::Simulation(const SimulationSettings& settings, std::unique_ptr<WorldQuery> world)
    : settings_(settings),
      rng_(settings.seed),
      world_(std::move(world)),
      pheromones_(settings.pheromone),
      hazards_(settings.hazard),
      termites_(settings.termite),
      scheduler_(settings.scheduler) {
  settings_.simulation_speed = std::clamp(settings_.simulation_speed, kMinSimulationSpeed, kMaxSimulationSpeed);
  settings_.ant.carry_mode = settings_.carry_mode;
  settings_.ant.trail_clusters = settings_.trail_clusters;
  if (!(settings_.max_substep_sec > 0.0f)) settings_.max_substep_sec = 0.1f;

  pheromones_.set_decay_rate(settings_.pheromone_decay_rate);
  pheromones_.set_food_trail_decay(settings_.food_trail_decay);

  if (!world_) {
    auto grid = std::make_unique<TerrainGrid>(settings_.bounds, settings_.environment, rng_);
    terrain_ = grid.get();
    world_ = std::move(grid);
  }
  settings_.bounds = world_->bounds();

  populate();
}

SimulationContext Simulation::context() {
  return SimulationContext{pheromones_, food_,   hazards_, corpses_,      *colony_,
                           termites_,   *world_, rng_,     events_,       settings_.ant,
                           scheduler_.weather(), attack_active_};
}

void Simulation::populate() {
  const Vec2 center = settings_.bounds.center();

  colony_ = std::make_unique<Colony>(center, settings_.colony, settings_.ant);
  colony_->set_showcase(settings_.showcase);

  food_.create_random(settings_.food_count, settings_.bounds, center, rng_, settings_.food_min_colony_distance);
  hazards_.spawn_random(settings_.puddle_count, settings_.bounds, center, rng_);

  initial_remaining_ = settings_.ant_count;
  initial_timer_sec_ = 0.0f;

  if (settings_.showcase) {
    SimulationContext ctx = context();
    for (std::size_t i = 0; i < settings_.ant_count; ++i) {
      colony_->spawn_ant(ctx);
    }
    initial_remaining_ = 0;
    events_.update();
  }

  spdlog::info("Simulation: world {:.0f}x{:.0f}, {} ants, {} food sources, {} puddles{}",
               settings_.bounds.width(), settings_.bounds.height(), settings_.ant_count, food_.sources().size(),
               hazards_.size(), settings_.showcase ? " (showcase)" : "");
}

void Simulation::reset() {
  pheromones_.clear();
  food_.clear();
  hazards_.clear();
  corpses_.clear();
  termites_.clear();
  scheduler_.reset();
  events_.clear();

  elapsed_sec_ = 0.0;
  attack_active_ = false;

  if (terrain_) terrain_->regenerate(settings_.environment, rng_);
  populate();

  spdlog::info("Simulation: reset");
}

// ----------------------------------------------------------------------------
// Clock
// ----------------------------------------------------------------------------
void Simulation::advance(double delta_ms) {
  if (paused_) return;
  if (!std::isfinite(delta_ms) || delta_ms <= 0.0) return;

  double remaining = delta_ms * static_cast<double>(settings_.simulation_speed) / 1000.0;
  const double max_step = static_cast<double>(settings_.max_substep_sec);

  while (remaining > 0.0) {
    const double dt = std::min(remaining, max_step);
    step(static_cast<float>(dt));
    remaining -= dt;
  }
}

void Simulation::step(float dt_sec) {
  if (!(dt_sec > 0.0f)) return;

  SimulationContext ctx = context();
  elapsed_sec_ += static_cast<double>(dt_sec);

  update_initial_spawn(dt_sec, ctx);

  pheromones_.tick(dt_sec);

  colony_->update_ants(dt_sec, ctx);
  colony_->reconcile(dt_sec, ctx);

  for (const FoodSource& gone : food_.update(dt_sec)) {
    events_.enqueue(evt::FoodDepleted{gone.id(), gone.position()});
  }

  hazards_.update(colony_->ants(), pheromones_, rng_);

  termites_.update(dt_sec, ctx);
  if (attack_active_ && termites_.empty()) end_attack(ctx);

  if (!settings_.showcase) {
    apply(scheduler_.tick(dt_sec, colony_->food_storage(), rng_), ctx);

    if (const auto puddle = hazards_.maybe_spawn(dt_sec, settings_.bounds, colony_->center(), rng_)) {
      if (const Puddle* p = hazards_.try_get(*puddle)) {
        events_.enqueue(evt::PuddleSpawned{p->id, p->position, p->radius});
      }
    }
  } else {
    // Rain started by hand still has to stop.
    const ScheduledEvents fired = scheduler_.tick(dt_sec, 0.0f, rng_);
    if (fired.rain_ended) apply(ScheduledEvents{false, 0.0f, true, false}, ctx);
  }

  events_.update();
}

void Simulation::update_initial_spawn(float dt_sec, SimulationContext& ctx) {
  if (initial_remaining_ == 0) return;

  initial_timer_sec_ += dt_sec;
  if (initial_timer_sec_ < settings_.initial_spawn_interval_sec) return;

  colony_->spawn_ant(ctx);
  --initial_remaining_;
  initial_timer_sec_ = 0.0f;
}

void Simulation::apply(const ScheduledEvents& fired, SimulationContext& ctx) {
  if (fired.rain_ended) {
    events_.enqueue(evt::RainEnded{});
    spdlog::info("Simulation: rain ended");
  }

  if (fired.rain_started_sec > 0.0f) {
    events_.enqueue(evt::RainStarted{fired.rain_started_sec});
    spdlog::info("Simulation: rain started for {:.1f}s", fired.rain_started_sec);
  }

  if (fired.raid) start_termite_attack();

  if (fired.evolve) {
    ctx.colony.evolve();
    events_.enqueue(evt::ColonyEvolved{ctx.colony.generation()});
    spdlog::info("Simulation: colony evolved to generation {} (spawn cost {:.0f}, cap {})",
                 ctx.colony.generation(), ctx.colony.spawn_cost(), ctx.colony.max_population());
  }
}

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------
bool Simulation::start_termite_attack() {
  if (attack_active_) return false;

  const std::size_t count = scheduler_.raid_size(colony_->population());
  termites_.spawn_raid(count, settings_.bounds, rng_);
  attack_active_ = true;

  events_.enqueue(evt::AttackStarted{static_cast<std::uint32_t>(count)});
  spdlog::info("Simulation: termite attack started, {} termites", count);
  return true;
}

void Simulation::end_attack(SimulationContext& ctx) {
  attack_active_ = false;
  ctx.attack_active = false;
  colony_->reset_all_to_exploring(ctx);

  const auto alive = static_cast<std::uint32_t>(colony_->population());
  events_.enqueue(evt::AttackEnded{alive});
  spdlog::info("Simulation: termite attack repelled, {} ants left", alive);
}

bool Simulation::start_rain(float duration_sec) {
  if (!scheduler_.start_rain(duration_sec)) return false;
  events_.enqueue(evt::RainStarted{duration_sec});
  spdlog::info("Simulation: rain started for {:.1f}s", duration_sec);
  return true;
}

bool Simulation::start_rain() {
  const SchedulerTuning& t = scheduler_.tuning();
  return start_rain(rng_.uniform(t.min_rain_sec, t.max_rain_sec));
}

// ----------------------------------------------------------------------------
// Host actions / knobs
// ----------------------------------------------------------------------------
FoodId Simulation::add_food_at(Vec2 position, float amount) {
  const FoodId id = food_.create(settings_.bounds.clamp(position), amount);
  spdlog::debug("Simulation: food source {} added at ({:.0f}, {:.0f}) with {:.0f}", id, position.x, position.y,
                amount);
  return id;
}

FoodId Simulation::add_random_food() {
  constexpr int kMaxAttempts = 64;
  const Vec2 center = colony_->center();

  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    const Vec2 p{rng_.uniform(settings_.bounds.min_x, settings_.bounds.max_x),
                 rng_.uniform(settings_.bounds.min_y, settings_.bounds.max_y)};
    if (distance(p, center) < settings_.food_min_colony_distance) continue;
    return add_food_at(p, rng_.uniform(50.0f, 200.0f));
  }

  spdlog::warn("Simulation: no room for new food away from the colony");
  return kInvalidId;
}

void Simulation::set_simulation_speed(float speed) noexcept {
  if (!std::isfinite(speed)) return;
  settings_.simulation_speed = std::clamp(speed, kMinSimulationSpeed, kMaxSimulationSpeed);
}

void Simulation::set_pheromone_decay_rate(float rate) noexcept {
  pheromones_.set_decay_rate(rate);
  settings_.pheromone_decay_rate = pheromones_.tuning().decay_rate;
}

// ----------------------------------------------------------------------------
// Snapshot
// ----------------------------------------------------------------------------
Snapshot Simulation::snapshot() const {
  const Colony& c = *colony_;

  Snapshot s{};
  s.elapsed_sec = elapsed_sec_;
  s.paused = paused_;

  s.population = c.population();
  s.max_population = c.max_population();
  s.food_storage = c.food_storage();
  s.spawn_cost = c.spawn_cost();
  s.total_born = c.total_born();
  s.total_died = c.total_died();
  s.generation = c.generation();
  s.efficiency = c.efficiency();
  s.ant_status = status_for_storage(c.food_storage());

  s.has_queen = c.has_queen();
  s.flight = c.flight_state();
  s.brood = c.brood();
  s.emerged = c.emerged();

  s.pheromones = pheromones_.counts_by_type();
  s.pheromone_total = pheromones_.size();
  s.ant_states = c.count_by_state();

  s.termites_alive = termites_.alive_count();
  s.attack_active = attack_active_;
  s.raining = scheduler_.raining();
  s.rain_remaining_sec = scheduler_.rain_remaining_sec();

  s.food = food_.stats();
  s.hazards = hazards_.stats();
  s.corpses = corpses_.size();
  s.corpses_collected = corpses_.total_collected();
  return s;
}

} // namespace antsim::sim
