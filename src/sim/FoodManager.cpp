#include "FoodManager.hpp"

#include "core/Rng.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace antsim::sim {

FoodSource::FoodSource(FoodId id, Vec2 position, float amount)
    : id_(id),
      position_(position),
      amount_(std::max(0.0f, amount)),
      max_amount_(std::max(0.0f, amount)),
      active_(amount > 0.0f) {}

float FoodSource::collect(float requested) {
  if (depleted() || !(requested > 0.0f)) return 0.0f;

  const float taken = std::min(requested, amount_);
  amount_ -= taken;

  if (amount_ <= 0.0f) {
    deplete();
  } else if (amount_ <= kNearEmptyAmount && grace_remaining_sec_ <= 0.0f) {
    grace_remaining_sec_ = kGraceWindowSec;
  }
  return taken;
}

void FoodSource::destroy() {
  deplete();
}

bool FoodSource::tick(float dt_sec) {
  if (!active_) return false;
  if (grace_remaining_sec_ <= 0.0f) return false;

  grace_remaining_sec_ -= dt_sec;
  if (grace_remaining_sec_ > 0.0f) return false;

  grace_remaining_sec_ = 0.0f;
  if (amount_ > 0.0f && amount_ <= kNearEmptyAmount) {
    deplete();
    return true;
  }
  return false;
}

void FoodSource::deplete() noexcept {
  amount_ = 0.0f;
  active_ = false;
  grace_remaining_sec_ = 0.0f;
}

FoodId FoodManager::create(Vec2 position, float amount) {
  const FoodId id = next_id_++;
  sources_.emplace_back(id, position, amount);
  return id;
}

void FoodManager::create_random(std::size_t count, const Bounds& bounds, Vec2 colony, core::Rng& rng,
                                float min_colony_distance) {
  constexpr int kMaxAttempts = 64;

  for (std::size_t i = 0; i < count; ++i) {
    Vec2 p{};
    int attempts = 0;
    do {
      p = {rng.uniform(bounds.min_x, bounds.max_x), rng.uniform(bounds.min_y, bounds.max_y)};
      ++attempts;
    } while (distance(p, colony) < min_colony_distance && attempts < kMaxAttempts);

    if (distance(p, colony) < min_colony_distance) {
      spdlog::debug("FoodManager: no free spot away from the colony after {} attempts", attempts);
      continue;
    }
    create(p, rng.uniform(50.0f, 200.0f));
  }
}

std::vector<FoodSource> FoodManager::update(float dt_sec) {
  for (FoodSource& f : sources_) {
    f.tick(dt_sec);
  }

  std::vector<FoodSource> removed;
  for (const FoodSource& f : sources_) {
    if (f.depleted()) removed.push_back(f);
  }
  std::erase_if(sources_, [](const FoodSource& f) { return f.depleted(); });
  return removed;
}

FoodSource* FoodManager::try_get(FoodId id) {
  for (FoodSource& f : sources_) {
    if (f.id() == id) return &f;
  }
  return nullptr;
}

const FoodSource* FoodManager::try_get(FoodId id) const {
  for (const FoodSource& f : sources_) {
    if (f.id() == id) return &f;
  }
  return nullptr;
}

FoodSource* FoodManager::nearest_active(Vec2 pos, float max_distance) {
  FoodSource* nearest = nullptr;
  float nearest_distance = max_distance;

  for (FoodSource& f : sources_) {
    if (f.depleted()) continue;
    const float d = distance(f.position(), pos);
    if (d < nearest_distance) {
      nearest_distance = d;
      nearest = &f;
    }
  }
  return nearest;
}

std::vector<FoodId> FoodManager::in_radius(Vec2 pos, float radius) const {
  std::vector<FoodId> out;
  for (const FoodSource& f : sources_) {
    if (f.depleted()) continue;
    if (distance(f.position(), pos) <= radius) out.push_back(f.id());
  }
  return out;
}

FoodStats FoodManager::stats() const {
  FoodStats s{};
  s.total_sources = sources_.size();
  s.total_collected = total_collected_;
  for (const FoodSource& f : sources_) {
    if (f.active()) ++s.active_sources;
    s.total_remaining += f.amount();
  }
  return s;
}

void FoodManager::clear() {
  sources_.clear();
  total_collected_ = 0.0f;
}

} // namespace antsim::sim
