#ifndef SRC_PACKET_P_ALL_H_
#define SRC_PACKET_P_ALL_H_

#include "packet/p_base.h"
#include "packet/p_incoming.h"
#include "packet/p_init.h"
#include "packet/p_misc.h"
#include "packet/p_room.h"
#include "packet/p_snake.h"

#endif  // SRC_PACKET_P_ALL_H_
