#include "game/room_registry.h"

#include <cctype>
#include <memory>

const char RoomRegistry::code_alphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

RoomRegistry::RoomRegistry(const RoomConfig &in_config, uint32_t seed)
    : config(in_config), random(seed) {}

std::string RoomRegistry::MakeCode() {
  static const int alphabet_size = sizeof(code_alphabet) - 1;
  std::string code;
  code.reserve(RoomConfig::code_length);
  for (size_t i = 0; i < RoomConfig::code_length; i++) {
    code.push_back(code_alphabet[random.Next(alphabet_size)]);
  }
  return code;
}

Room::Ptr RoomRegistry::Create() {
  std::string code;
  do {
    code = MakeCode();
  } while (rooms.count(code));

  auto room = std::make_shared<Room>(code, config, random.NextSeed());
  rooms.insert({code, room});
  return room;
}

Room::Ptr RoomRegistry::Lookup(const std::string &code) const {
  const auto it = rooms.find(Normalize(code));
  return it == rooms.end() ? nullptr : it->second;
}

bool RoomRegistry::Destroy(const std::string &code) {
  return rooms.erase(code) > 0;
}

std::string RoomRegistry::Normalize(const std::string &code) {
  std::string out(code);
  for (char &c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}
