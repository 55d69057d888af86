#include "Snapshot.hpp"

#include <spdlog/fmt/fmt.h>

namespace antsim::sim {

std::string describe(const Snapshot& s) {
  return fmt::format(
      "t={:.1f}s pop={}/{} food={:.0f} born={} died={} gen={} eff={:.2f} status={} "
      "brood(e={} l={} p={} a={}) flight={} "
      "scent(trail={} explore={} danger={}) "
      "ants(explore={} seek={} home={} trail={} rest={}) "
      "termites={}{}{} sources={} puddles={} corpses={}",
      s.elapsed_sec, s.population, s.max_population, s.food_storage, s.total_born, s.total_died,
      s.generation, s.efficiency, to_string(s.ant_status), s.brood.eggs, s.brood.larvae, s.brood.pupae,
      s.brood.adults, to_string(s.flight), s.deposits_of(PheromoneType::FoodTrail),
      s.deposits_of(PheromoneType::Exploration), s.deposits_of(PheromoneType::Danger),
      s.ants_in(AntState::Exploring), s.ants_in(AntState::SeekingFood), s.ants_in(AntState::ReturningHome),
      s.ants_in(AntState::FollowingTrail), s.ants_in(AntState::Resting), s.termites_alive,
      s.attack_active ? " [attack]" : "", s.raining ? " [rain]" : "", s.food.active_sources,
      s.hazards.total_puddles, s.corpses);
}

} // namespace antsim::sim
