#pragma once

#include "SimTypes.hpp"

#include <optional>
#include <variant>

namespace antsim::sim {

struct SimulationContext;

struct FoodRef      { FoodId id{kInvalidId}; };
struct PheromoneRef { DepositId id{kInvalidId}; };
struct TermiteRef   { TermiteId id{kInvalidId}; };
struct CorpseRef    { CorpseId id{kInvalidId}; };

// What an ant is heading for. Holds ids only; the owners are asked every time.
using Target = std::variant<std::monostate, FoodRef, PheromoneRef, TermiteRef, CorpseRef>;

[[nodiscard]] inline bool has_target(const Target& t) noexcept {
  return !std::holds_alternative<std::monostate>(t);
}

// Deposit id of a trail target, kInvalidId for anything else.
[[nodiscard]] inline DepositId trail_of(const Target& t) noexcept {
  if (const auto* p = std::get_if<PheromoneRef>(&t)) return p->id;
  return kInvalidId;
}

[[nodiscard]] std::optional<Vec2> position_of(const Target& t, const SimulationContext& ctx);

// Food: active and not depleted. Pheromone: still stored. Termite: alive. Corpse: uncollected.
[[nodiscard]] bool is_valid(const Target& t, const SimulationContext& ctx);

} // namespace antsim::sim
