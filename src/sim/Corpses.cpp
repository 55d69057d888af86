#include "Corpses.hpp"

#include <algorithm>

namespace antsim::sim {

CorpseId CorpseList::add(Vec2 position, AntRole role) {
  const CorpseId id = next_id_++;
  corpses_.push_back(Corpse{id, position, role, false});
  return id;
}

const Corpse* CorpseList::try_get(CorpseId id) const {
  for (const Corpse& c : corpses_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

bool CorpseList::collect(CorpseId id) {
  const auto it = std::find_if(corpses_.begin(), corpses_.end(),
                               [id](const Corpse& c) { return c.id == id; });
  if (it == corpses_.end() || it->collected) return false;

  corpses_.erase(it);
  ++total_collected_;
  return true;
}

const Corpse* CorpseList::nearest(Vec2 pos, float max_distance) const {
  const Corpse* best = nullptr;
  float best_distance = max_distance;
  for (const Corpse& c : corpses_) {
    if (c.collected) continue;
    const float d = distance(c.position, pos);
    if (d < best_distance) {
      best_distance = d;
      best = &c;
    }
  }
  return best;
}

void CorpseList::clear() {
  corpses_.clear();
  total_collected_ = 0;
}

} // namespace antsim::sim
