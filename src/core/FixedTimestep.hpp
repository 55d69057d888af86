#pragma once

#include <algorithm>
#include <cstdint>

namespace antsim::core {

struct TickResult {
  int steps{0};      // fixed updates run this frame
  double alpha{0.0}; // leftover fraction of a step [0,1)
};

// Accumulates variable frame time and hands out fixed-length steps.
// Large frames are clamped so a stall never turns into a catch-up spiral.
class FixedTimestep final {
public:
  explicit FixedTimestep(double dt_sec = 1.0 / 60.0, double max_frame_sec = 0.25) noexcept
      : dt_(std::max(dt_sec, 1e-6)), max_frame_(std::max(max_frame_sec, dt_)) {}

  // onFixedUpdate: void(double dt_sec, std::uint64_t tick)
  template <class UpdateFn>
  TickResult step(double frame_sec, UpdateFn&& onFixedUpdate) {
    accum_ += std::clamp(frame_sec, 0.0, max_frame_);

    int steps = 0;
    while (accum_ >= dt_) {
      onFixedUpdate(dt_, tick_++);
      accum_ -= dt_;
      ++steps;
    }
    return {steps, accum_ / dt_};
  }

  void reset() noexcept {
    accum_ = 0.0;
    tick_ = 0;
  }

  [[nodiscard]] double dt() const noexcept { return dt_; }
  [[nodiscard]] std::uint64_t ticks() const noexcept { return tick_; }

private:
  double dt_;
  double max_frame_;
  double accum_{0.0};
  std::uint64_t tick_{0};
};

} // namespace antsim::core
