#include "EventScheduler.hpp"

#include "core/Rng.hpp"

namespace antsim::sim {

ScheduledEvents EventScheduler::tick(float dt_sec, float colony_food, core::Rng& rng) {
  ScheduledEvents out{};

  if (raining_) {
    rain_remaining_sec_ -= dt_sec;
    if (rain_remaining_sec_ <= 0.0f) {
      raining_ = false;
      rain_remaining_sec_ = 0.0f;
      out.rain_ended = true;
    }
  }

  check_timer_sec_ += dt_sec;
  if (check_timer_sec_ >= tuning_.check_interval_sec) {
    check_timer_sec_ = 0.0f;

    const float roll = rng.next_float01();
    if (roll < tuning_.raid_threshold) {
      out.raid = true;
    } else if (roll < tuning_.rain_threshold) {
      const float duration = rng.uniform(tuning_.min_rain_sec, tuning_.max_rain_sec);
      if (start_rain(duration)) out.rain_started_sec = duration;
    }
  }

  if (colony_food > tuning_.evolve_food_threshold && rng.chance(tuning_.evolve_rate_per_sec * dt_sec)) {
    out.evolve = true;
  }

  return out;
}

bool EventScheduler::start_rain(float duration_sec) {
  if (raining_ || !(duration_sec > 0.0f)) return false;
  raining_ = true;
  rain_remaining_sec_ = duration_sec;
  return true;
}

void EventScheduler::reset() noexcept {
  check_timer_sec_ = 0.0f;
  raining_ = false;
  rain_remaining_sec_ = 0.0f;
}

} // namespace antsim::sim
