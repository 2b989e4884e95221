#ifndef SRC_SERVER_CONFIG_H_
#define SRC_SERVER_CONFIG_H_

#include <cstdint>
#include <string>

#include "game/config.h"

struct IncomingConfig {
  bool help = false;
  bool verbose = false;
  bool version = false;

  uint16_t port = 8787;
  std::string assets = "public";

  // 0 seeds from the OS.
  uint32_t seed = 0;

  // Connections with more queued bytes than this skip per-tick state frames.
  size_t max_buffered_bytes = 1 << 20;

  RoomConfig room;
};

IncomingConfig ParseCommandLine(const int argc, const char *const *argv);

#endif  // SRC_SERVER_CONFIG_H_
