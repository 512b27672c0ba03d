#include <gtest/gtest.h>

#include "dice.hpp"
#include "diceroller.hpp"

using namespace BGE;

TEST(Dice, PlainRollGivesTwoValues) {
  Dice d(5, 3);
  EXPECT_EQ(d.remaining(), (std::vector<int>{5, 3}));
  EXPECT_FALSE(d.doubles());
  EXPECT_EQ(d.max(), 5);
  EXPECT_EQ(d.to_string(), "5-3");
}

TEST(Dice, DoublesGiveFourValues) {
  Dice d(4, 4);
  EXPECT_TRUE(d.doubles());
  EXPECT_EQ(d.size(), 4u);
  EXPECT_EQ(d.remaining(), (std::vector<int>{4, 4, 4, 4}));
  EXPECT_EQ(d.faces(), std::make_pair(4, 4));
}

TEST(Dice, FacesSurviveConsumption) {
  Dice d(6, 2);
  d.consume(6);
  EXPECT_EQ(d.faces(), std::make_pair(6, 2));
  EXPECT_EQ(d.to_string(), "6-2");
}

TEST(Dice, ConsumeRemovesOneOccurrence) {
  Dice d(2, 2);
  d.consume(2);
  EXPECT_EQ(d.size(), 3u);
  d.consume(2);
  d.consume(2);
  d.consume(2);
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.max(), 0);
}

TEST(Dice, ConsumeUnavailableValueThrows) {
  Dice d(6, 1);
  try {
    d.consume(3);
    FAIL() << "expected InvalidDiceValue";
  } catch (const InvalidDiceValue& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_DICE_VALUE);
    EXPECT_EQ(e.value(), 3);
  }
  d.consume(6);
  EXPECT_THROW(d.consume(6), InvalidDiceValue);
  EXPECT_TRUE(d.contains(1));
}

TEST(Dice, FacesOutOfRangeThrow) {
  EXPECT_THROW(Dice(0, 3), std::invalid_argument);
  EXPECT_THROW(Dice(3, 7), std::invalid_argument);
}

TEST(Dice, EmptyLedger) {
  Dice d;
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.to_string(), "-");
}

TEST(DiceRoller, SeededRollsRepeat) {
  DiceRoller a(42), b(42);
  for (int i=0; i<50; ++i) {
    auto ra = a.roll();
    auto rb = b.roll();
    EXPECT_EQ(ra, rb);
    EXPECT_GE(ra.first, 1);
    EXPECT_LE(ra.first, 6);
    EXPECT_GE(ra.second, 1);
    EXPECT_LE(ra.second, 6);
  }
}
