#include <gtest/gtest.h>

#include "board.hpp"

using namespace BGE;

TEST(Board, StandardLayout) {
  Board b;
  EXPECT_EQ(b.total(WHITE), 15u);
  EXPECT_EQ(b.total(BLACK), 15u);

  EXPECT_EQ(b.checkersAt(24, WHITE), 2u);
  EXPECT_EQ(b.checkersAt(13, WHITE), 5u);
  EXPECT_EQ(b.checkersAt(8, WHITE), 3u);
  EXPECT_EQ(b.checkersAt(6, WHITE), 5u);

  EXPECT_EQ(b.checkersAt(1, BLACK), 2u);
  EXPECT_EQ(b.checkersAt(12, BLACK), 5u);
  EXPECT_EQ(b.checkersAt(17, BLACK), 3u);
  EXPECT_EQ(b.checkersAt(19, BLACK), 5u);

  EXPECT_EQ(b.countBar(WHITE), 0u);
  EXPECT_EQ(b.countOff(BLACK), 0u);
  EXPECT_FALSE(b.allInHome(WHITE));
}

TEST(Board, QueriesOutOfRangeAreEmpty) {
  Board b;
  EXPECT_EQ(b.checkersAt(0, WHITE), 0u);
  EXPECT_EQ(b.checkersAt(25, BLACK), 0u);
  EXPECT_FALSE(b.topSide(0).has_value());
  EXPECT_FALSE(b.isOpen(30, WHITE));
}

TEST(Board, TopSideAndOpenPoints) {
  Board b = Board::empty();
  b.place(7, BLACK, 1);
  b.place(9, BLACK, 2);
  b.place(10, WHITE, 3);

  ASSERT_TRUE(b.topSide(7).has_value());
  EXPECT_EQ(*b.topSide(7), BLACK);
  EXPECT_FALSE(b.topSide(8).has_value());

  EXPECT_TRUE(b.isOpen(7, WHITE));   // blot
  EXPECT_TRUE(b.isOpen(8, WHITE));   // empty
  EXPECT_FALSE(b.isOpen(9, WHITE));  // made point
  EXPECT_TRUE(b.isOpen(10, WHITE));  // own
}

TEST(Board, PlaceRejectsBadSetups) {
  Board b = Board::empty();
  b.place(5, WHITE, 2);
  EXPECT_THROW(b.place(5, BLACK, 1), std::logic_error);
  EXPECT_THROW(b.place(0, WHITE, 1), std::out_of_range);
  EXPECT_THROW(b.place(25, WHITE, 1), std::out_of_range);
  EXPECT_THROW(b.place(3, NONE, 1), std::invalid_argument);

  b.place(5, WHITE, 0);
  EXPECT_FALSE(b.topSide(5).has_value());
}

TEST(Board, ApplyHopHitsBlot) {
  Board b = Board::empty();
  b.place(13, WHITE, 1);
  b.place(7, BLACK, 1);

  Hop done = b.applyHop(WHITE, Hop{13, 7, 6, false, false});
  EXPECT_TRUE(done.hit);
  EXPECT_FALSE(done.borneOff);
  EXPECT_EQ(b.checkersAt(7, WHITE), 1u);
  EXPECT_EQ(b.checkersAt(13, WHITE), 0u);
  EXPECT_EQ(b.countBar(BLACK), 1u);
}

TEST(Board, ApplyHopEntersAndBearsOff) {
  Board b = Board::empty();
  b.setBar(BLACK, 1);
  b.place(22, BLACK, 1);

  Hop in = b.applyHop(BLACK, Hop{0, 3, 3, false, false});
  EXPECT_FALSE(in.borneOff);
  EXPECT_EQ(b.countBar(BLACK), 0u);
  EXPECT_EQ(b.checkersAt(3, BLACK), 1u);

  Hop off = b.applyHop(BLACK, Hop{22, 25, 3, false, false});
  EXPECT_TRUE(off.borneOff);
  EXPECT_EQ(b.countOff(BLACK), 1u);
}

TEST(Board, ApplyHopWithoutCheckerThrows) {
  Board b = Board::empty();
  EXPECT_THROW(b.applyHop(WHITE, Hop{13, 7, 6, false, false}), std::logic_error);
}

TEST(Board, HomeAndDistanceQueries) {
  Board b = Board::empty();
  b.place(3, WHITE, 2);
  b.place(5, WHITE, 1);
  EXPECT_TRUE(b.allInHome(WHITE));
  EXPECT_TRUE(b.anyFurtherFromHome(WHITE, 3));
  EXPECT_FALSE(b.anyFurtherFromHome(WHITE, 5));

  b.setBar(WHITE, 1);
  EXPECT_FALSE(b.allInHome(WHITE));

  b.place(20, BLACK, 1);
  b.place(23, BLACK, 1);
  EXPECT_TRUE(b.anyFurtherFromHome(BLACK, 23));
  EXPECT_FALSE(b.anyFurtherFromHome(BLACK, 20));
}

TEST(Board, CopiesCompareByPosition) {
  Board a;
  Board c = a;
  EXPECT_EQ(a, c);
  c.applyHop(WHITE, Hop{24, 18, 6, false, false});
  EXPECT_NE(a, c);
  EXPECT_EQ(a.checkersAt(24, WHITE), 2u);
}

TEST(Board, RelativeNumbering) {
  EXPECT_EQ(toAbsolute(WHITE, 6), 6);
  EXPECT_EQ(toAbsolute(BLACK, 6), 19);
  EXPECT_EQ(toRelative(BLACK, 1), 24);
  EXPECT_EQ(opponent(WHITE), BLACK);
  EXPECT_EQ(opponent(NONE), NONE);
}
