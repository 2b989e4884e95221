#ifndef SRC_SERVER_ROOM_TICKER_H_
#define SRC_SERVER_ROOM_TICKER_H_

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include "game/room.h"
#include "game/room_registry.h"
#include "server/server.h"

// Fixed-rate timers, one per running room, keyed by room code. Tasks hold a
// non-owning Room pointer, so Stop() must be called before the room is
// destroyed; a timer that fires after Stop() is ignored.
class RoomTicker {
 public:
  typedef std::function<void(Room *)> TickHandler;

  RoomTicker(WSPPServer *endpoint, TickHandler handler);

  void Start(Room *room, long interval_ms);
  bool Stop(const std::string &code);
  void StopAll();

  // Stops the room's timer, then removes the room from the registry.
  bool Retire(RoomRegistry *registry, const std::string &code);

  bool IsActive(const std::string &code) const;
  size_t size() const { return tasks.size(); }

 private:
  struct Task {
    Room *room;
    long interval_ms;
    long last_time_point;
    uint64_t generation;
    WSPPServer::timer_ptr timer;
  };

  void NextTick(const std::string &code, Task *task, long last);
  void on_timer(const std::string &code, uint64_t generation,
                error_code const &ec);

  static long GetCurrentTime();

  WSPPServer *endpoint;
  TickHandler handler;
  std::unordered_map<std::string, Task> tasks;
  uint64_t next_generation = 1;
};

#endif  // SRC_SERVER_ROOM_TICKER_H_
