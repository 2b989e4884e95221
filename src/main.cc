#include <iostream>

#include "server/config.h"
#include "server/game.h"

#ifndef GRIDSNAKE_VERSION
#define GRIDSNAKE_VERSION "0.0.0"
#endif

int main(int argc, char **argv) {
  const IncomingConfig config = ParseCommandLine(argc, argv);
  if (config.version) {
    std::cout << "gridsnake_server " << GRIDSNAKE_VERSION << std::endl;
    return 0;
  }

  GameServer server(config);
  return server.Run();
}
