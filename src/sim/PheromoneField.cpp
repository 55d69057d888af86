#include "PheromoneField.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace antsim::sim {

namespace {
[[nodiscard]] bool matches(const PheromoneDeposit& d, std::optional<PheromoneType> type) noexcept {
  return !type || d.type == *type;
}

[[nodiscard]] bool older(const PheromoneDeposit& a, const PheromoneDeposit& b) noexcept {
  if (a.age_sec != b.age_sec) return a.age_sec > b.age_sec;
  return a.id < b.id;
}
} // namespace

PheromoneField::PheromoneField() : PheromoneField(PheromoneTuning{}) {}

PheromoneField::PheromoneField(const PheromoneTuning& tuning) : tuning_(tuning) {
  grid_.set_cell_size(tuning_.cell_size);
  set_decay_rate(tuning_.decay_rate);
  deposits_.reserve(tuning_.max_deposits + 1);
  index_by_id_.reserve(tuning_.max_deposits + 1);
}

void PheromoneField::set_decay_rate(float rate) noexcept {
  if (!std::isfinite(rate)) return;
  tuning_.decay_rate = std::clamp(rate, kMinDecayRate, kMaxDecayRate);
}

DepositId PheromoneField::deposit(Vec2 pos, PheromoneType type, float base_intensity) {
  if (!std::isfinite(base_intensity) || base_intensity <= 0.0f) return kInvalidId;
  if (!std::isfinite(pos.x) || !std::isfinite(pos.y)) return kInvalidId;

  float adjusted = base_intensity;
  switch (type) {
    case PheromoneType::Danger:
      adjusted = std::min(base_intensity * tuning_.danger_multiplier, tuning_.danger_cap);
      break;
    case PheromoneType::FoodTrail:
      adjusted = std::min(base_intensity * tuning_.food_trail_multiplier, tuning_.food_trail_deposit_cap);
      break;
    default:
      adjusted = std::min(base_intensity, tuning_.exploration_cap);
      break;
  }

  PheromoneDeposit d{};
  d.id = next_id_++;
  d.position = pos;
  d.type = type;
  d.intensity = adjusted;
  d.base_intensity = adjusted;

  index_by_id_.emplace(d.id, deposits_.size());
  deposits_.push_back(d);
  grid_.insert(d.id, pos);

  if (deposits_.size() > tuning_.max_deposits) {
    enforce_capacity();
    if (!contains(d.id)) return kInvalidId;
  }
  return d.id;
}

float PheromoneField::decayed_intensity(const PheromoneDeposit& d) const noexcept {
  switch (d.type) {
    case PheromoneType::Danger:
      return d.intensity;

    case PheromoneType::FoodTrail: {
      const float max_age = std::max(0.001f, tuning_.food_trail_max_age_sec);
      float base = 0.0f;
      if (tuning_.food_trail_decay == TrailDecay::Linear) {
        base = d.base_intensity * std::max(0.0f, 1.0f - d.age_sec / max_age);
      } else {
        base = d.base_intensity * std::exp(-d.age_sec * tuning_.decay_rate);
      }
      const float bonus = std::min(static_cast<float>(d.follower_count) * tuning_.follower_bonus_per_ant,
                                   tuning_.follower_bonus_cap);
      return std::min(base + bonus, tuning_.food_trail_cap);
    }

    default:
      return std::min(d.base_intensity * std::exp(-d.age_sec * tuning_.decay_rate), tuning_.exploration_cap);
  }
}

bool PheromoneField::is_expired(const PheromoneDeposit& d) const noexcept {
  if (d.type == PheromoneType::Danger) return false;
  if (d.type == PheromoneType::FoodTrail && d.age_sec >= tuning_.food_trail_max_age_sec) return true;
  return d.intensity < tuning_.removal_threshold;
}

void PheromoneField::tick(float dt_sec) {
  dt_sec = std::max(0.0f, dt_sec);

  std::vector<DepositId> expired;
  for (PheromoneDeposit& d : deposits_) {
    d.age_sec += dt_sec;
    d.intensity = decayed_intensity(d);
    if (is_expired(d)) expired.push_back(d.id);
  }

  for (DepositId id : expired) {
    const auto it = index_by_id_.find(id);
    if (it != index_by_id_.end()) remove_index_at(it->second);
  }
}

template <class Fn>
void PheromoneField::for_each_in_radius(Vec2 pos, float radius, std::optional<PheromoneType> type, Fn&& fn) const {
  if (!(radius > 0.0f)) return;
  const float r2 = radius * radius;

  grid_.query_circle_candidates(pos, radius, [&](std::uint32_t id) {
    const PheromoneDeposit* d = try_get(id);
    if (!d || !matches(*d, type)) return;
    const float d2 = distance_sq(d->position, pos);
    if (d2 > r2) return;
    fn(*d, std::sqrt(d2));
  });
}

std::optional<PheromoneHit> PheromoneField::find_strongest(
    Vec2 pos, float radius, std::optional<PheromoneType> type, DepositId exclude) const {
  std::optional<PheromoneHit> best;
  float best_score = 0.0f;

  for_each_in_radius(pos, radius, type, [&](const PheromoneDeposit& d, float dist) {
    if (d.id == exclude) return;
    const float score = d.intensity * (1.0f - dist / radius);
    if (score > best_score) {
      best_score = score;
      best = PheromoneHit{d.id, d.position, d.type, d.intensity, dist};
    }
  });
  return best;
}

std::vector<PheromoneHit> PheromoneField::find_in_radius(
    Vec2 pos, float radius, std::optional<PheromoneType> type) const {
  std::vector<PheromoneHit> out;
  for_each_in_radius(pos, radius, type, [&](const PheromoneDeposit& d, float dist) {
    out.push_back(PheromoneHit{d.id, d.position, d.type, d.intensity, dist});
  });

  std::sort(out.begin(), out.end(), [](const PheromoneHit& a, const PheromoneHit& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.id < b.id;
  });
  return out;
}

float PheromoneField::density_at(Vec2 pos, float radius, std::optional<PheromoneType> type) const {
  float total = 0.0f;
  for_each_in_radius(pos, radius, type, [&](const PheromoneDeposit& d, float dist) {
    total += d.intensity * (1.0f - dist / radius);
  });
  return total;
}

void PheromoneField::add_follower(DepositId id) {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return;
  PheromoneDeposit& d = deposits_[it->second];
  if (d.type != PheromoneType::FoodTrail) return;
  ++d.follower_count;
}

void PheromoneField::remove_follower(DepositId id) {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return;
  PheromoneDeposit& d = deposits_[it->second];
  if (d.follower_count > 0) --d.follower_count;
}

const PheromoneDeposit* PheromoneField::try_get(DepositId id) const {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &deposits_[it->second];
}

std::size_t PheromoneField::count(PheromoneType type) const noexcept {
  return static_cast<std::size_t>(std::count_if(deposits_.begin(), deposits_.end(),
      [type](const PheromoneDeposit& d) { return d.type == type; }));
}

std::array<std::size_t, kPheromoneTypeCount> PheromoneField::counts_by_type() const noexcept {
  std::array<std::size_t, kPheromoneTypeCount> out{};
  for (const PheromoneDeposit& d : deposits_) {
    ++out[static_cast<std::size_t>(d.type)];
  }
  return out;
}

void PheromoneField::clear() {
  deposits_.clear();
  index_by_id_.clear();
  grid_.clear();
}

void PheromoneField::remove_index_at(std::size_t idx) {
  if (idx >= deposits_.size()) return;

  const std::size_t last = deposits_.size() - 1U;
  const PheromoneDeposit removed = deposits_[idx];

  if (!grid_.erase(removed.id, removed.position)) {
    spdlog::warn("PheromoneField: deposit {} missing from its grid bucket", removed.id);
  }

  if (idx != last) {
    std::swap(deposits_[idx], deposits_[last]);
    index_by_id_[deposits_[idx].id] = idx;
  }

  deposits_.pop_back();
  index_by_id_.erase(removed.id);
}

void PheromoneField::enforce_capacity() {
  const auto danger_limit = static_cast<std::size_t>(
      std::clamp(tuning_.max_danger_share, 0.0f, 1.0f) * static_cast<float>(tuning_.max_deposits));
  std::size_t danger = count(PheromoneType::Danger);
  std::size_t evicted = 0;

  // Oldest first. Danger is spared while it stays within its share, and goes
  // first once it holds more than that.
  while (deposits_.size() > tuning_.max_deposits) {
    const bool evict_danger = danger > danger_limit;

    std::size_t victim = deposits_.size();
    for (std::size_t i = 0; i < deposits_.size(); ++i) {
      const PheromoneDeposit& d = deposits_[i];
      if ((d.type == PheromoneType::Danger) != evict_danger) continue;
      if (victim == deposits_.size() || older(d, deposits_[victim])) victim = i;
    }
    // Nothing of the preferred kind: fall back to the oldest of the rest.
    if (victim == deposits_.size()) {
      victim = 0;
      for (std::size_t i = 1; i < deposits_.size(); ++i) {
        if (older(deposits_[i], deposits_[victim])) victim = i;
      }
    }

    if (deposits_[victim].type == PheromoneType::Danger) --danger;
    remove_index_at(victim);
    ++evicted;
  }

  spdlog::trace("PheromoneField: evicted {} deposits over capacity {}", evicted, tuning_.max_deposits);
}

} // namespace antsim::sim
