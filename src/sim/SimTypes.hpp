#pragma once

#include <cmath>
#include <cstdint>
#include <string_view>

namespace antsim::sim {

// ----------------------------------------------------------------------------
// Identifiers (one id space per entity family, 0 is never handed out)
// ----------------------------------------------------------------------------
using AntId = std::uint32_t;
using FoodId = std::uint32_t;
using DepositId = std::uint32_t;
using TermiteId = std::uint32_t;
using CorpseId = std::uint32_t;
using PuddleId = std::uint32_t;

inline constexpr std::uint32_t kInvalidId{0};

// ----------------------------------------------------------------------------
// Minimal math
// ----------------------------------------------------------------------------
struct Vec2 {
  float x{0.0f};
  float y{0.0f};

  constexpr Vec2() = default;
  constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}
};

[[nodiscard]] constexpr Vec2 operator+(Vec2 a, Vec2 b) noexcept { return {a.x + b.x, a.y + b.y}; }
[[nodiscard]] constexpr Vec2 operator-(Vec2 a, Vec2 b) noexcept { return {a.x - b.x, a.y - b.y}; }
[[nodiscard]] constexpr Vec2 operator*(Vec2 v, float s) noexcept { return {v.x * s, v.y * s}; }
[[nodiscard]] constexpr Vec2 operator*(float s, Vec2 v) noexcept { return v * s; }

constexpr Vec2& operator+=(Vec2& a, Vec2 b) noexcept {
  a.x += b.x;
  a.y += b.y;
  return a;
}

[[nodiscard]] constexpr float dot(Vec2 a, Vec2 b) noexcept { return a.x * b.x + a.y * b.y; }
[[nodiscard]] constexpr float length_sq(Vec2 v) noexcept { return dot(v, v); }
[[nodiscard]] inline float length(Vec2 v) noexcept { return std::sqrt(length_sq(v)); }
[[nodiscard]] inline float distance(Vec2 a, Vec2 b) noexcept { return length(a - b); }
[[nodiscard]] constexpr float distance_sq(Vec2 a, Vec2 b) noexcept { return length_sq(a - b); }

[[nodiscard]] inline Vec2 from_angle(float radians) noexcept {
  return {std::cos(radians), std::sin(radians)};
}

// Bearing from `from` to `to`. Coincident points yield `fallback` instead of atan2(0, 0).
[[nodiscard]] inline float bearing(Vec2 from, Vec2 to, float fallback) noexcept {
  const Vec2 d = to - from;
  if (length_sq(d) <= 0.0f) return fallback;
  return std::atan2(d.y, d.x);
}

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kTwoPi = 2.0f * kPi;

struct Bounds {
  float min_x{0.0f};
  float min_y{0.0f};
  float max_x{1800.0f};
  float max_y{1350.0f};

  [[nodiscard]] constexpr float width() const noexcept { return max_x - min_x; }
  [[nodiscard]] constexpr float height() const noexcept { return max_y - min_y; }
  [[nodiscard]] constexpr Vec2 center() const noexcept {
    return {(min_x + max_x) * 0.5f, (min_y + max_y) * 0.5f};
  }
  [[nodiscard]] constexpr bool contains(Vec2 p) const noexcept {
    return p.x >= min_x && p.x <= max_x && p.y >= min_y && p.y <= max_y;
  }
  [[nodiscard]] Vec2 clamp(Vec2 p) const noexcept {
    return {std::fmin(std::fmax(p.x, min_x), max_x), std::fmin(std::fmax(p.y, min_y), max_y)};
  }
};

// ----------------------------------------------------------------------------
// Enumerations
// ----------------------------------------------------------------------------
enum class PheromoneType : std::uint8_t {
  FoodTrail   = 0,
  Exploration = 1,
  Danger      = 2,
  Count
};

inline constexpr std::size_t kPheromoneTypeCount =
    static_cast<std::size_t>(PheromoneType::Count);

[[nodiscard]] constexpr std::string_view to_string(PheromoneType t) noexcept {
  switch (t) {
    case PheromoneType::FoodTrail:   return "food_trail";
    case PheromoneType::Exploration: return "exploration";
    case PheromoneType::Danger:      return "danger";
    default:                         return "unknown";
  }
}

enum class AntRole : std::uint8_t {
  Worker  = 0,
  Soldier = 1,
  Scout   = 2,
  Forager = 3,
  Nurse   = 4,
  Queen   = 5,
  Count
};

[[nodiscard]] constexpr std::string_view to_string(AntRole r) noexcept {
  switch (r) {
    case AntRole::Worker:  return "worker";
    case AntRole::Soldier: return "soldier";
    case AntRole::Scout:   return "scout";
    case AntRole::Forager: return "forager";
    case AntRole::Nurse:   return "nurse";
    case AntRole::Queen:   return "queen";
    default:               return "unknown";
  }
}

enum class AntState : std::uint8_t {
  Exploring        = 0,
  SeekingFood      = 1,
  ReturningHome    = 2,
  FollowingTrail   = 3,
  AttackingTermite = 4,
  Hiding           = 5,
  FeedingBrood     = 6,
  CollectingCorpse = 7,
  AvoidingDanger   = 8,
  Resting          = 9,
  Count
};

inline constexpr std::size_t kAntStateCount = static_cast<std::size_t>(AntState::Count);

[[nodiscard]] constexpr std::string_view to_string(AntState s) noexcept {
  switch (s) {
    case AntState::Exploring:        return "exploring";
    case AntState::SeekingFood:      return "seeking_food";
    case AntState::ReturningHome:    return "returning_home";
    case AntState::FollowingTrail:   return "following_trail";
    case AntState::AttackingTermite: return "attacking_termite";
    case AntState::Hiding:           return "hiding";
    case AntState::FeedingBrood:     return "feeding_brood";
    case AntState::CollectingCorpse: return "collecting_corpse";
    case AntState::AvoidingDanger:   return "avoiding_danger";
    case AntState::Resting:          return "resting";
    default:                         return "unknown";
  }
}

enum class TermiteState : std::uint8_t {
  Seeking         = 0,
  AttackingFood   = 1,
  AttackingColony = 2,
  AttackingAnt    = 3
};

[[nodiscard]] constexpr std::string_view to_string(TermiteState s) noexcept {
  switch (s) {
    case TermiteState::Seeking:         return "seeking";
    case TermiteState::AttackingFood:   return "attacking_food";
    case TermiteState::AttackingColony: return "attacking_colony";
    case TermiteState::AttackingAnt:    return "attacking_ant";
    default:                            return "unknown";
  }
}

enum class Weather : std::uint8_t {
  Clear = 0,
  Rain  = 1
};

enum class DeathCause : std::uint8_t {
  Starvation = 0,
  Hazard     = 1,
  Combat     = 2,
  Exhaustion = 3
};

[[nodiscard]] constexpr std::string_view to_string(DeathCause c) noexcept {
  switch (c) {
    case DeathCause::Starvation: return "starvation";
    case DeathCause::Hazard:     return "hazard";
    case DeathCause::Combat:     return "combat";
    case DeathCause::Exhaustion: return "exhaustion";
    default:                     return "unknown";
  }
}

// When an ant counts as "carrying food" after a pickup.
enum class CarryMode : std::uint8_t {
  AnyAmount = 0, // as soon as anything is held
  FullLoad  = 1  // only once carry capacity is reached
};

// Curve applied to FoodTrail deposits over their fixed lifetime.
enum class TrailDecay : std::uint8_t {
  Linear      = 0,
  Exponential = 1
};

} // namespace antsim::sim
