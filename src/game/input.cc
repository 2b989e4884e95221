#include "game/input.h"

bool InputReconciler::Submit(player_id_t id, double dx, double dy,
                             int64_t seq) {
  const Vec2 dir{Math::sanitize_component(dx), Math::sanitize_component(dy)};
  if (!Math::is_unit_axis(dir)) {
    return false;
  }
  samples[id] = InputSample{dir, seq};
  return true;
}

void InputReconciler::Forget(player_id_t id) { samples.erase(id); }

const InputSample *InputReconciler::Find(player_id_t id) const {
  const auto it = samples.find(id);
  return it == samples.end() ? nullptr : &it->second;
}

void InputReconciler::Apply(PlayerMap &players) const {
  for (auto &entry : players) {
    Player &p = entry.second;
    if (!p.alive) {
      continue;
    }
    const InputSample *sample = Find(p.id);
    if (!sample) {
      continue;
    }
    ApplyDirection(p, sample->dir);
    p.Acknowledge(sample->seq);
  }
}

bool InputReconciler::ApplyDirection(Player &p, const Vec2 &dir) {
  if (Math::is_reverse(p.dir, dir)) {
    return false;
  }
  p.dir = dir;
  return true;
}
