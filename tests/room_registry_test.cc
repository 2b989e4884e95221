#include <cctype>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "game/room_registry.h"

TEST(RoomRegistry, CreateUsesUnambiguousAlphabet) {
  RoomRegistry registry(RoomConfig(), 17);
  for (int i = 0; i < 200; i++) {
    const Room::Ptr room = registry.Create();
    ASSERT_NE(room, nullptr);
    EXPECT_EQ(room->state(), RoomState::lobby);
    ASSERT_EQ(room->code().size(), 5u);
    for (char c : room->code()) {
      EXPECT_NE(std::strchr(RoomRegistry::code_alphabet, c), nullptr) << c;
      EXPECT_NE(c, 'O');
      EXPECT_NE(c, '0');
      EXPECT_NE(c, 'I');
      EXPECT_NE(c, '1');
    }
  }
  EXPECT_EQ(registry.size(), 200u);
}

TEST(RoomRegistry, LookupIgnoresCase) {
  RoomRegistry registry(RoomConfig(), 3);
  const Room::Ptr room = registry.Create();

  std::string lower = room->code();
  for (char &c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  EXPECT_EQ(registry.Lookup(room->code()), room);
  EXPECT_EQ(registry.Lookup(lower), room);
  EXPECT_EQ(registry.Lookup("ZZZZZZ"), nullptr);
  EXPECT_EQ(registry.Lookup(""), nullptr);
}

TEST(RoomRegistry, DestroyRemovesRoom) {
  RoomRegistry registry(RoomConfig(), 5);
  const Room::Ptr room = registry.Create();
  const std::string code = room->code();

  EXPECT_TRUE(registry.Destroy(code));
  EXPECT_EQ(registry.Lookup(code), nullptr);
  EXPECT_FALSE(registry.Destroy(code));
  EXPECT_EQ(registry.size(), 0u);
}

TEST(RoomRegistry, LiveCodesStayUniqueUnderChurn) {
  RoomRegistry registry(RoomConfig(), 99);
  Random random(123);
  std::vector<std::string> live;

  for (int i = 0; i < 2000; i++) {
    if (!live.empty() && random.Next(3) == 0) {
      const size_t idx = static_cast<size_t>(random.Next(static_cast<int>(live.size())));
      ASSERT_TRUE(registry.Destroy(live[idx]));
      live.erase(live.begin() + static_cast<long>(idx));
    } else {
      live.push_back(registry.Create()->code());
    }

    const std::set<std::string> unique(live.begin(), live.end());
    ASSERT_EQ(unique.size(), live.size());
    ASSERT_EQ(registry.size(), live.size());
  }
}

TEST(RoomRegistry, RoomsAreIndependent) {
  RoomRegistry registry(RoomConfig(), 8);
  const Room::Ptr a = registry.Create();
  const Room::Ptr b = registry.Create();

  ASSERT_EQ(a->AddPlayer(1, "a", "red"), JoinResult::ok);
  ASSERT_EQ(b->AddPlayer(2, "b", "blue"), JoinResult::ok);
  ASSERT_TRUE(a->Start(1000));

  EXPECT_EQ(a->state(), RoomState::running);
  EXPECT_EQ(b->state(), RoomState::lobby);
  EXPECT_EQ(a->FindPlayer(2), nullptr);
  EXPECT_EQ(b->FindPlayer(1), nullptr);
}
