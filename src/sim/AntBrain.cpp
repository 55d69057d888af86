#include "AntBrain.hpp"

namespace antsim::sim {

namespace {

AntDecision keep(const AntMind& mind) {
  AntDecision d{};
  d.state = mind.state;
  d.target = mind.target;
  return d;
}

AntDecision go(AntState state, Target target = {}) {
  AntDecision d{};
  d.state = state;
  d.target = target;
  return d;
}

} // namespace

AntDecision decide(const AntMind& mind, const AntPerception& seen) {
  const bool carrying = mind.carrying_food;

  // 1. Colony under attack: soldiers engage, everyone else shelters.
  if (seen.attack_active) {
    if (mind.role == AntRole::Soldier) {
      if (seen.termite) return go(AntState::AttackingTermite, TermiteRef{seen.termite->id});
    } else {
      return go(AntState::Hiding);
    }
  }

  AntState state = mind.state;
  Target target = mind.target;
  bool target_valid = mind.target_valid;

  if (state == AntState::Hiding && !seen.attack_active) {
    state = AntState::Exploring;
    target = {};
    target_valid = false;
  }

  // 2. Nurses tend the brood.
  if (mind.role == AntRole::Nurse && !carrying && state != AntState::FeedingBrood) {
    return go(AntState::FeedingBrood);
  }

  // 3. Corpses. An ant already on its way keeps its corpse.
  if (!carrying && !mind.carrying_corpse) {
    if (state == AntState::CollectingCorpse && target_valid && std::holds_alternative<CorpseRef>(target)) {
      return keep(mind);
    }
    if (state != AntState::CollectingCorpse && seen.corpse) {
      return go(AntState::CollectingCorpse, CorpseRef{seen.corpse->id});
    }
  }

  // 4. Danger.
  bool reset_speed = false;
  if (!carrying && seen.danger) {
    AntDecision d = go(AntState::AvoidingDanger);
    d.flee = true;
    d.flee_from = seen.danger->position;
    return d;
  }
  if (state == AntState::AvoidingDanger) {
    reset_speed = true;
  }

  // 5. Foraging.
  AntDecision d{};
  if (carrying || mind.carrying_corpse) {
    d = go(AntState::ReturningHome);
  } else if (target_valid && std::holds_alternative<FoodRef>(target)) {
    d = go(AntState::SeekingFood, target);
  } else if (state == AntState::FollowingTrail && target_valid && std::holds_alternative<PheromoneRef>(target)) {
    d = go(AntState::FollowingTrail, target);
  } else if (seen.trail) {
    d = go(AntState::FollowingTrail, PheromoneRef{seen.trail->id});
  } else if (seen.food) {
    d = go(AntState::SeekingFood, FoodRef{seen.food->id});
  } else {
    d = go(AntState::Exploring);
  }
  d.reset_speed = reset_speed;
  return d;
}

} // namespace antsim::sim
