#include "game/player.h"

void Player::Spawn(const BodySeq &in_body, Vec2 in_dir) {
  body = in_body;
  dir = in_dir;
  alive = true;
  respawn_at = boost::none;
}

void Player::Kill(int64_t now, int64_t respawn_ms) {
  if (!alive) {
    return;
  }
  alive = false;
  respawn_at = now + respawn_ms;
  body.clear();
}

bool Player::CanRespawn(int64_t now) const {
  return !alive && respawn_at && now >= *respawn_at;
}

bool Player::Acknowledge(int64_t seq) {
  if (seq <= ack_seq) {
    return false;
  }
  ack_seq = seq;
  return true;
}

std::string Player::SanitizeName(const std::string &in) {
  std::string out;
  size_t points = 0;
  size_t i = 0;
  while (i < in.size() && points < RoomConfig::max_name_length) {
    const unsigned char lead = static_cast<unsigned char>(in[i]);
    size_t len = 1;
    if (lead >= 0xf0) {
      len = 4;
    } else if (lead >= 0xe0) {
      len = 3;
    } else if (lead >= 0xc0) {
      len = 2;
    }
    if (i + len > in.size()) {
      break;
    }
    out.append(in, i, len);
    i += len;
    points++;
  }
  return out;
}
