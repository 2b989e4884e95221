#include <limits>

#include <gtest/gtest.h>

#include "game/input.h"

namespace {

Player MakePlayer(player_id_t id, Vec2 dir) {
  Player p(id, "p", "green");
  p.Spawn(BodySeq{{1, 3}, {2, 3}, {3, 3}}, dir);
  return p;
}

}  // namespace

TEST(Math, SanitizeComponent) {
  EXPECT_EQ(Math::sanitize_component(5.0), 1);
  EXPECT_EQ(Math::sanitize_component(-42.5), -1);
  EXPECT_EQ(Math::sanitize_component(0.4), 0);
  EXPECT_EQ(Math::sanitize_component(0.6), 1);
  EXPECT_EQ(Math::sanitize_component(-0.6), -1);
  EXPECT_EQ(Math::sanitize_component(std::numeric_limits<double>::quiet_NaN()),
            0);
}

TEST(InputReconciler, AcceptsClampedAxisDirections) {
  InputReconciler inputs;
  ASSERT_TRUE(inputs.Submit(1, 7.0, 0.0, 1));
  EXPECT_EQ(inputs.Find(1)->dir, (Vec2{1, 0}));

  ASSERT_TRUE(inputs.Submit(1, 0.0, -3.0, 2));
  EXPECT_EQ(inputs.Find(1)->dir, (Vec2{0, -1}));
  EXPECT_EQ(inputs.Find(1)->seq, 2);
}

TEST(InputReconciler, RejectsDiagonalAndZero) {
  InputReconciler inputs;
  EXPECT_FALSE(inputs.Submit(1, 1.0, 1.0, 1));
  EXPECT_FALSE(inputs.Submit(1, 0.0, 0.0, 2));
  EXPECT_FALSE(inputs.Submit(1, 0.2, -0.3, 3));
  EXPECT_EQ(inputs.Find(1), nullptr);

  ASSERT_TRUE(inputs.Submit(1, 0.0, 1.0, 4));
  EXPECT_FALSE(inputs.Submit(1, -1.0, 1.0, 5));
  EXPECT_EQ(inputs.Find(1)->dir, (Vec2{0, 1}));
  EXPECT_EQ(inputs.Find(1)->seq, 4);
}

TEST(InputReconciler, LatestSubmissionWins) {
  InputReconciler inputs;
  PlayerMap players;
  players[1] = MakePlayer(1, Math::dir_right);

  inputs.Submit(1, 0.0, 1.0, 1);
  inputs.Submit(1, 0.0, -1.0, 2);
  inputs.Apply(players);

  EXPECT_EQ(players[1].dir, Math::dir_up);
  EXPECT_EQ(players[1].ack_seq, 2);
  EXPECT_EQ(inputs.size(), 1u);
}

TEST(InputReconciler, ReversalIsIgnoredButAcknowledged) {
  InputReconciler inputs;
  PlayerMap players;
  players[1] = MakePlayer(1, Math::dir_right);

  inputs.Submit(1, -1.0, 0.0, 9);
  inputs.Apply(players);

  EXPECT_EQ(players[1].dir, Math::dir_right);
  EXPECT_EQ(players[1].ack_seq, 9);
}

TEST(InputReconciler, AcknowledgedSequenceNeverDecreases) {
  InputReconciler inputs;
  PlayerMap players;
  players[1] = MakePlayer(1, Math::dir_right);

  inputs.Submit(1, 0.0, 1.0, 5);
  inputs.Apply(players);
  ASSERT_EQ(players[1].ack_seq, 5);

  inputs.Submit(1, 0.0, 1.0, 3);
  inputs.Apply(players);
  EXPECT_EQ(players[1].ack_seq, 5);

  EXPECT_FALSE(players[1].Acknowledge(-1));
  EXPECT_TRUE(players[1].Acknowledge(6));
  EXPECT_EQ(players[1].ack_seq, 6);
}

TEST(InputReconciler, DeadPlayersAreNotSteered) {
  InputReconciler inputs;
  PlayerMap players;
  players[1] = MakePlayer(1, Math::dir_right);
  players[1].Kill(1000, 2000);

  inputs.Submit(1, 0.0, 1.0, 4);
  inputs.Apply(players);

  EXPECT_EQ(players[1].dir, Math::dir_right);
  EXPECT_EQ(players[1].ack_seq, 0);
}

TEST(InputReconciler, ForgetDropsSample) {
  InputReconciler inputs;
  inputs.Submit(1, 0.0, 1.0, 1);
  inputs.Submit(2, 1.0, 0.0, 1);
  inputs.Forget(1);

  EXPECT_EQ(inputs.Find(1), nullptr);
  EXPECT_NE(inputs.Find(2), nullptr);
  EXPECT_EQ(inputs.size(), 1u);
}
