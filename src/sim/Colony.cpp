#include "Colony.hpp"

#include "SimEvents.hpp"
#include "SimulationContext.hpp"
#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace antsim::sim {

namespace {

constexpr AntRole kSpawnRoles[] = {AntRole::Worker, AntRole::Soldier, AntRole::Scout, AntRole::Forager,
                                   AntRole::Nurse};
constexpr int kSpawnRoleCount = static_cast<int>(sizeof(kSpawnRoles) / sizeof(kSpawnRoles[0]));

} // namespace

Colony::Colony(Vec2 center, const ColonyTuning& tuning, const AntTuning& ant_tuning)
    : center_(center),
      tuning_(tuning),
      ant_tuning_(ant_tuning),
      food_storage_(std::max(0.0f, tuning.initial_food)),
      max_population_(std::min(tuning.max_population, tuning.population_ceiling)),
      spawn_cost_(std::max(tuning.spawn_cost, tuning.spawn_cost_floor)) {}

// ----------------------------------------------------------------------------
// Roster
// ----------------------------------------------------------------------------
Ant* Colony::spawn_ant(SimulationContext& ctx) {
  return spawn(ctx, true);
}

Ant* Colony::spawn(SimulationContext& ctx, bool pay) {
  if (population() >= max_population_) return nullptr;
  if (pay && food_storage_ < spawn_cost_) return nullptr;

  AntRole role = kSpawnRoles[ctx.rng.uniform_int(0, kSpawnRoleCount - 1)];
  if (!has_queen_ && ctx.rng.chance(tuning_.queen_chance)) {
    role = AntRole::Queen;
    has_queen_ = true;
    spdlog::info("Colony: a queen has been designated");
  }

  if (pay) food_storage_ -= spawn_cost_;

  const float spread = tuning_.spawn_spread;
  const Vec2 at = center_ + Vec2{ctx.rng.uniform(-spread, spread), ctx.rng.uniform(-spread, spread)};

  const AntId id = next_id_++;
  index_by_id_[id] = ants_.size();
  ants_.emplace_back(id, role, at, ant_tuning_, ctx.rng);
  ++total_born_;

  ctx.events.enqueue(evt::AntSpawned{id, role, at});
  return &ants_.back();
}

Ant* Colony::try_get(AntId id) {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &ants_[it->second];
}

const Ant* Colony::try_get(AntId id) const {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &ants_[it->second];
}

std::size_t Colony::population() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(ants_.begin(), ants_.end(), [](const Ant& a) { return a.alive(); }));
}

bool Colony::soldiers_alive() const noexcept {
  return std::any_of(ants_.begin(), ants_.end(),
                     [](const Ant& a) { return a.alive() && a.role() == AntRole::Soldier; });
}

std::array<std::size_t, kAntStateCount> Colony::count_by_state() const noexcept {
  std::array<std::size_t, kAntStateCount> counts{};
  for (const Ant& a : ants_) {
    if (!a.alive()) continue;
    ++counts[static_cast<std::size_t>(a.state())];
  }
  return counts;
}

void Colony::update_ants(float dt_sec, SimulationContext& ctx) {
  // Nothing spawns while ants act, so the roster does not move under us.
  for (Ant& ant : ants_) {
    ant.update(dt_sec, ctx);
  }
}

std::size_t Colony::sweep_dead(SimulationContext& ctx) {
  std::size_t removed = 0;
  bool queen_lost = false;

  std::size_t i = 0;
  while (i < ants_.size()) {
    if (ants_[i].alive()) {
      ++i;
      continue;
    }

    if (ants_[i].role() == AntRole::Queen) queen_lost = true;
    index_by_id_.erase(ants_[i].id());

    const std::size_t last = ants_.size() - 1;
    if (i != last) {
      ants_[i] = std::move(ants_[last]);
      index_by_id_[ants_[i].id()] = i;
    }
    ants_.pop_back();
    ++removed;
  }

  total_died_ += static_cast<std::uint32_t>(removed);
  if (queen_lost) on_queen_lost(ctx);
  return removed;
}

void Colony::on_queen_lost(SimulationContext& ctx) {
  const bool in_flight = flight_ == FlightState::NuptialFlight;

  has_queen_ = std::any_of(ants_.begin(), ants_.end(),
                           [](const Ant& a) { return a.alive() && a.role() == AntRole::Queen; });
  if (has_queen_) return;

  flight_ = FlightState::Idle;
  flight_timer_sec_ = 0.0f;
  phase_timer_sec_ = 0.0f;
  if (in_flight) ctx.events.enqueue(evt::QueenFlightEnded{});

  spdlog::info("Colony: the queen died, flight cycle reset");
}

void Colony::reset_all_to_exploring(SimulationContext& ctx) {
  for (Ant& ant : ants_) {
    ant.reset_to_exploring(ctx);
  }
}

void Colony::reconcile(float dt_sec, SimulationContext& ctx) {
  sweep_dead(ctx);

  if (!showcase_) {
    spawn_timer_sec_ += dt_sec;
    if (spawn_timer_sec_ >= tuning_.spawn_interval_sec && food_storage_ >= spawn_cost_) {
      spawn_ant(ctx);
      spawn_timer_sec_ = 0.0f;
    }

    if (has_queen_) update_queen_cycle(dt_sec, ctx);
    update_brood(dt_sec, ctx);
  }

  apply_relief(dt_sec);
}

// ----------------------------------------------------------------------------
// Reproduction
// ----------------------------------------------------------------------------
void Colony::update_queen_cycle(float dt_sec, SimulationContext& ctx) {
  switch (flight_) {
    case FlightState::Idle:
      flight_timer_sec_ += dt_sec;
      if (flight_timer_sec_ < tuning_.flight_interval_sec) break;

      flight_timer_sec_ = 0.0f;
      if (food_storage_ >= tuning_.flight_cost) {
        food_storage_ -= tuning_.flight_cost;
        flight_ = FlightState::NuptialFlight;
        phase_timer_sec_ = 0.0f;
        ctx.events.enqueue(evt::QueenFlightStarted{center_, tuning_.flight_duration_sec});
        spdlog::info("Colony: queen starting nuptial flight (storage now {:.0f})", food_storage_);
      }
      break;

    case FlightState::NuptialFlight:
      phase_timer_sec_ += dt_sec;
      if (phase_timer_sec_ >= tuning_.flight_duration_sec) {
        flight_ = FlightState::PostFlight;
        phase_timer_sec_ = 0.0f;
        ctx.events.enqueue(evt::QueenFlightEnded{});
        spdlog::info("Colony: queen returned from nuptial flight");
      }
      break;

    case FlightState::PostFlight:
      phase_timer_sec_ += dt_sec;
      if (phase_timer_sec_ >= tuning_.post_flight_sec) {
        const auto eggs = static_cast<std::uint32_t>(ctx.rng.uniform_int(tuning_.min_eggs, tuning_.max_eggs));
        brood_.eggs += eggs;
        flight_ = FlightState::Idle;
        phase_timer_sec_ = 0.0f;
        flight_timer_sec_ = 0.0f;
        ctx.events.enqueue(evt::EggsLaid{eggs});
        spdlog::info("Colony: queen laid {} eggs", eggs);
      }
      break;
  }
}

void Colony::update_brood(float dt_sec, SimulationContext& ctx) {
  core::Rng& rng = ctx.rng;

  if (brood_.eggs > 0) {
    const float p = dt_sec / tuning_.egg_window_sec * static_cast<float>(brood_.eggs);
    if (rng.chance(p)) {
      --brood_.eggs;
      ++brood_.larvae;
    }
  }

  if (brood_.larvae > 0 && food_storage_ >= tuning_.larva_food_cost) {
    const float p = dt_sec / tuning_.larva_window_sec * static_cast<float>(brood_.larvae);
    if (rng.chance(p)) {
      --brood_.larvae;
      ++brood_.pupae;
      food_storage_ -= tuning_.larva_food_cost;
    }
  }

  if (brood_.pupae > 0 && food_storage_ >= tuning_.pupa_food_cost) {
    const float p = dt_sec / tuning_.pupa_window_sec * static_cast<float>(brood_.pupae);
    if (rng.chance(p)) {
      --brood_.pupae;
      ++brood_.adults;
      food_storage_ -= tuning_.pupa_food_cost;
    }
  }

  if (brood_.adults > 0) {
    const auto batch = static_cast<std::uint32_t>(rng.uniform_int(1, tuning_.max_emerge_per_tick));
    const std::uint32_t emerge = std::min(brood_.adults, batch);
    for (std::uint32_t i = 0; i < emerge; ++i) {
      // Adults wait in the nest while the colony is full.
      if (!spawn(ctx, false)) break;
      --brood_.adults;
      ++emerged_;
    }
  }
}

void Colony::apply_relief(float dt_sec) {
  relief_cooldown_sec_ = std::max(0.0f, relief_cooldown_sec_ - dt_sec);
  if (food_storage_ >= tuning_.relief_threshold || relief_cooldown_sec_ > 0.0f) return;

  for (Ant& ant : ants_) {
    ant.add_energy(tuning_.relief_energy);
  }
  relief_cooldown_sec_ = tuning_.relief_interval_sec;
  spdlog::debug("Colony: emergency relief for {} ants (storage {:.1f})", ants_.size(), food_storage_);
}

// ----------------------------------------------------------------------------
// Larder / growth
// ----------------------------------------------------------------------------
void Colony::add_food(float amount) noexcept {
  if (!(amount > 0.0f)) return;
  food_storage_ += amount;
}

float Colony::take_food(float amount) noexcept {
  if (!(amount > 0.0f)) return 0.0f;
  const float taken = std::min(amount, food_storage_);
  food_storage_ -= taken;
  return taken;
}

void Colony::set_food_storage(float amount) noexcept {
  food_storage_ = std::max(0.0f, amount);
}

float Colony::efficiency() const noexcept {
  if (total_born_ == 0) return 1.0f;
  return (static_cast<float>(total_born_) - static_cast<float>(total_died_)) / static_cast<float>(total_born_);
}

void Colony::evolve() noexcept {
  ++generation_;
  spawn_cost_ = std::max(tuning_.spawn_cost_floor, spawn_cost_ - tuning_.evolve_cost_step);
  max_population_ = std::min(tuning_.population_ceiling, max_population_ + tuning_.evolve_population_step);
}

} // namespace antsim::sim
