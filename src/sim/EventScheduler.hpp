#pragma once

#include "SimTypes.hpp"

#include <algorithm>
#include <cstddef>

namespace antsim::core {
class Rng;
}

namespace antsim::sim {

struct SchedulerTuning {
  float check_interval_sec{30.0f};
  float raid_threshold{0.004f}; // roll below: termite raid
  float rain_threshold{0.104f}; // roll below (and not a raid): rain
  float min_rain_sec{10.0f};
  float max_rain_sec{25.0f};

  float evolve_rate_per_sec{0.06f};
  float evolve_food_threshold{200.0f};

  std::size_t min_raid_size{3};
  std::size_t ants_per_termite{3};
};

// What fired during one scheduler tick. The simulation applies it.
struct ScheduledEvents {
  bool raid{false};
  float rain_started_sec{0.0f}; // > 0 when rain began this tick
  bool rain_ended{false};
  bool evolve{false};
};

// Random world events on a fixed check cadence, plus the rain timer.
class EventScheduler final {
public:
  EventScheduler() = default;
  explicit EventScheduler(const SchedulerTuning& tuning) : tuning_(tuning) {}

  [[nodiscard]] const SchedulerTuning& tuning() const noexcept { return tuning_; }

  ScheduledEvents tick(float dt_sec, float colony_food, core::Rng& rng);

  // False when it is already raining.
  bool start_rain(float duration_sec);

  [[nodiscard]] bool raining() const noexcept { return raining_; }
  [[nodiscard]] Weather weather() const noexcept { return raining_ ? Weather::Rain : Weather::Clear; }
  [[nodiscard]] float rain_remaining_sec() const noexcept { return rain_remaining_sec_; }
  [[nodiscard]] float seconds_until_check() const noexcept {
    return std::max(0.0f, tuning_.check_interval_sec - check_timer_sec_);
  }

  // One termite per three ants, never fewer than three.
  [[nodiscard]] std::size_t raid_size(std::size_t population) const noexcept {
    return std::max(tuning_.min_raid_size, population / tuning_.ants_per_termite);
  }

  void reset() noexcept;

private:
  SchedulerTuning tuning_{};
  float check_timer_sec_{0.0f};
  bool raining_{false};
  float rain_remaining_sec_{0.0f};
};

} // namespace antsim::sim
