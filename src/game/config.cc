#include "game/config.h"

const size_t RoomConfig::max_players;
const size_t RoomConfig::spawn_length;
const int RoomConfig::random_spawn_attempts;
const size_t RoomConfig::code_length;
const size_t RoomConfig::max_name_length;
