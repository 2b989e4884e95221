#ifndef SRC_GAME_ROOM_REGISTRY_H_
#define SRC_GAME_ROOM_REGISTRY_H_

#include <string>
#include <unordered_map>

#include "game/config.h"
#include "game/random.h"
#include "game/room.h"

// Live rooms keyed by their short join code. Owned by the connection layer;
// there is no process-wide instance.
class RoomRegistry {
 public:
  typedef std::unordered_map<std::string, Room::Ptr> RoomMap;

  explicit RoomRegistry(const RoomConfig &config, uint32_t seed = 0);

  // New lobby room under a code not used by any live room.
  Room::Ptr Create();

  // Null when no live room has this code. Lookup is case-insensitive.
  Room::Ptr Lookup(const std::string &code) const;

  // Call once the room has no members and its ticker is stopped.
  bool Destroy(const std::string &code);

  size_t size() const { return rooms.size(); }

  // Excludes 0/O and 1/I.
  static const char code_alphabet[];
  static std::string Normalize(const std::string &code);

 private:
  std::string MakeCode();

  RoomConfig config;
  Random random;
  RoomMap rooms;
};

#endif  // SRC_GAME_ROOM_REGISTRY_H_
