#include "Target.hpp"

#include "Corpses.hpp"
#include "FoodManager.hpp"
#include "PheromoneField.hpp"
#include "SimulationContext.hpp"
#include "Termite.hpp"

namespace antsim::sim {

std::optional<Vec2> position_of(const Target& t, const SimulationContext& ctx) {
  if (const auto* r = std::get_if<FoodRef>(&t)) {
    if (const FoodSource* f = ctx.food.try_get(r->id)) return f->position();
  } else if (const auto* r = std::get_if<PheromoneRef>(&t)) {
    if (const PheromoneDeposit* d = ctx.pheromones.try_get(r->id)) return d->position;
  } else if (const auto* r = std::get_if<TermiteRef>(&t)) {
    if (const Termite* tm = ctx.termites.try_get(r->id)) return tm->position();
  } else if (const auto* r = std::get_if<CorpseRef>(&t)) {
    if (const Corpse* c = ctx.corpses.try_get(r->id)) return c->position;
  }
  return std::nullopt;
}

bool is_valid(const Target& t, const SimulationContext& ctx) {
  if (const auto* r = std::get_if<FoodRef>(&t)) {
    const FoodSource* f = ctx.food.try_get(r->id);
    return f && !f->depleted();
  }
  if (const auto* r = std::get_if<PheromoneRef>(&t)) {
    return ctx.pheromones.contains(r->id);
  }
  if (const auto* r = std::get_if<TermiteRef>(&t)) {
    const Termite* tm = ctx.termites.try_get(r->id);
    return tm && tm->alive();
  }
  if (const auto* r = std::get_if<CorpseRef>(&t)) {
    const Corpse* c = ctx.corpses.try_get(r->id);
    return c && !c->collected;
  }
  return false;
}

} // namespace antsim::sim
