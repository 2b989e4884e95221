#ifndef SRC_GAME_ROOM_H_
#define SRC_GAME_ROOM_H_

#include <cstdint>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "game/config.h"
#include "game/events.h"
#include "game/input.h"
#include "game/player.h"
#include "game/random.h"

enum class RoomState : uint8_t { lobby, running, ended };

const char *ToString(RoomState s);

enum class JoinResult : uint8_t { ok, full, ended, duplicate };

struct TickResult {
  RoomEvents events;
  // Set on the tick that moved the room to ended; nothing else ran.
  bool ended = false;
  int steps = 0;
};

// One isolated match. lobby -> running -> ended, never back.
class Room {
 public:
  typedef std::shared_ptr<Room> Ptr;

  Room(std::string code, const RoomConfig &config, uint32_t seed = 0);

  JoinResult AddPlayer(player_id_t id, const std::string &name,
                       const std::string &color);
  bool RemovePlayer(player_id_t id);
  Player *FindPlayer(player_id_t id);

  // Buffers the direction for the next tick and acknowledges seq right away.
  // Refused once the round has ended.
  bool SubmitInput(player_id_t id, double dx, double dy, int64_t seq);

  // lobby -> running. Returns false (and does nothing) in any other state.
  bool Start(int64_t now);

  // One fixed-rate tick: end check, respawns, input, movement steps.
  TickResult Tick(int64_t now);

  // running -> ended. Returns false if the room was not running.
  bool End();

  void PlaceFood();

  const std::string &code() const { return code_; }
  RoomState state() const { return state_; }
  const RoomConfig &config() const { return config_; }
  const boost::optional<int64_t> &started_at() const { return started_at_; }
  const boost::optional<int64_t> &ends_at() const { return ends_at_; }
  uint64_t tick() const { return tick_; }
  double speed() const { return speed_; }
  double accumulator() const { return accumulator_; }
  const boost::optional<Vec2> &food() const { return food_; }
  const PlayerMap &players() const { return players_; }
  const InputReconciler &inputs() const { return inputs_; }

  size_t size() const { return players_.size(); }
  bool empty() const { return players_.empty(); }
  bool full() const { return players_.size() >= RoomConfig::max_players; }

 private:
  void SpawnPlayer(Player &p);

  std::string code_;
  RoomConfig config_;
  RoomState state_ = RoomState::lobby;

  boost::optional<int64_t> started_at_;
  boost::optional<int64_t> ends_at_;
  int64_t last_tick_at_ = 0;

  uint64_t tick_ = 0;
  double speed_;
  double accumulator_ = 0.0;

  boost::optional<Vec2> food_;
  PlayerMap players_;
  InputReconciler inputs_;
  Random random_;
};

#endif  // SRC_GAME_ROOM_H_
