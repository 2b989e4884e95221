#include "game/room.h"

#include <algorithm>
#include <utility>

#include "game/collision.h"
#include "game/spawn.h"

const char *ToString(RoomState s) {
  switch (s) {
    case RoomState::lobby:
      return "lobby";
    case RoomState::running:
      return "running";
    case RoomState::ended:
      return "ended";
  }
  return "unknown";
}

Room::Room(std::string code, const RoomConfig &config, uint32_t seed)
    : code_(std::move(code)),
      config_(config),
      speed_(config.speed),
      random_(seed) {}

JoinResult Room::AddPlayer(player_id_t id, const std::string &name,
                           const std::string &color) {
  if (state_ == RoomState::ended) {
    return JoinResult::ended;
  }
  if (full()) {
    return JoinResult::full;
  }
  if (players_.count(id)) {
    return JoinResult::duplicate;
  }

  Player &p = players_[id];
  p = Player(id, Player::SanitizeName(name), color);
  SpawnPlayer(p);

  if (!food_) {
    PlaceFood();
  }
  return JoinResult::ok;
}

bool Room::RemovePlayer(player_id_t id) {
  inputs_.Forget(id);
  return players_.erase(id) > 0;
}

Player *Room::FindPlayer(player_id_t id) {
  const auto it = players_.find(id);
  return it == players_.end() ? nullptr : &it->second;
}

bool Room::SubmitInput(player_id_t id, double dx, double dy, int64_t seq) {
  if (state_ == RoomState::ended) {
    return false;
  }
  Player *p = FindPlayer(id);
  if (!p || !inputs_.Submit(id, dx, dy, seq)) {
    return false;
  }
  p->Acknowledge(seq);
  return true;
}

void Room::SpawnPlayer(Player &p) {
  const SpawnPlan plan =
      SpawnPlanner::Plan(players_, food_, config_.grid, random_);
  p.Spawn(plan.body, plan.dir);
}

void Room::PlaceFood() {
  food_ = SpawnPlanner::RandomFreeCell(players_, boost::none, config_.grid,
                                       random_);
}

bool Room::Start(int64_t now) {
  if (state_ != RoomState::lobby) {
    return false;
  }

  state_ = RoomState::running;
  started_at_ = now;
  ends_at_ = now + config_.round_ms;
  last_tick_at_ = now;
  accumulator_ = 0.0;

  // Lobby bodies are cleared first so that players take the corner presets
  // in join order.
  for (auto &entry : players_) {
    entry.second.body.clear();
  }
  for (auto &entry : players_) {
    Player &p = entry.second;
    SpawnPlayer(p);
    p.score = 0;
  }
  for (const auto &entry : players_) {
    inputs_.Forget(entry.first);
  }

  food_ = boost::none;
  PlaceFood();
  return true;
}

bool Room::End() {
  if (state_ != RoomState::running) {
    return false;
  }
  state_ = RoomState::ended;
  return true;
}

TickResult Room::Tick(int64_t now) {
  TickResult result;
  if (state_ != RoomState::running) {
    return result;
  }

  tick_++;
  if (ends_at_ && now >= *ends_at_) {
    result.ended = End();
    return result;
  }

  for (auto &entry : players_) {
    Player &p = entry.second;
    if (!p.CanRespawn(now)) {
      continue;
    }
    SpawnPlayer(p);
    result.events.push_back(RespawnEvent{p.id, p.body, p.dir});
  }

  inputs_.Apply(players_);

  const double elapsed =
      std::max<int64_t>(0, now - last_tick_at_) / 1000.0;
  last_tick_at_ = now;

  // At most two steps per tick after a scheduling hiccup.
  const double step = 1.0 / speed_;
  accumulator_ = std::min(accumulator_ + elapsed, step * 2);

  while (accumulator_ >= step) {
    inputs_.Apply(players_);
    CollisionResolver::Step(players_, food_, config_, now, random_,
                            &result.events);
    accumulator_ -= step;
    result.steps++;
  }

  return result;
}
