#include <gtest/gtest.h>

#include "notation.hpp"

using namespace BGE;

namespace {

ErrorCode parseError(const std::string& text) {
  try {
    parse(text);
  } catch (const NotationError& e) {
    return e.code();
  }
  return ErrorCode::NONE;
}

} // namespace

TEST(Notation, SingleMove) {
  auto ms = parse("13/7");
  ASSERT_EQ(ms.size(), 1u);
  EXPECT_EQ(ms[0].kind, MoveKind(Normal{13, 7}));
  EXPECT_EQ(ms[0].origin(), 13);
  EXPECT_EQ(ms[0].destination(), 7);
}

TEST(Notation, IndependentMovesGetDistinctGroups) {
  auto ms = parse("1/2 5/9");
  ASSERT_EQ(ms.size(), 2u);
  EXPECT_EQ(ms[0].kind, MoveKind(Normal{1, 2}));
  EXPECT_EQ(ms[1].kind, MoveKind(Normal{5, 9}));
  EXPECT_NE(ms[0].group, ms[1].group);
}

TEST(Notation, ChainSharesGroup) {
  auto ms = parse("8/3/1");
  ASSERT_EQ(ms.size(), 2u);
  EXPECT_EQ(ms[0].kind, MoveKind(Normal{8, 3}));
  EXPECT_EQ(ms[1].kind, MoveKind(Normal{3, 1}));
  EXPECT_EQ(ms[0].group, ms[1].group);
}

TEST(Notation, BarAndOff) {
  auto ms = parse("bar/22 BAR/20/14 6/off");
  ASSERT_EQ(ms.size(), 4u);
  EXPECT_EQ(ms[0].kind, MoveKind(Enter{22}));
  EXPECT_EQ(ms[0].origin(), BAR_STOP);
  EXPECT_EQ(ms[1].kind, MoveKind(Enter{20}));
  EXPECT_EQ(ms[2].kind, MoveKind(Normal{20, 14}));
  EXPECT_EQ(ms[3].kind, MoveKind(BearOff{6}));
  EXPECT_EQ(ms[3].destination(), OFF_STOP);
}

TEST(Notation, EmptyInputIsEmptyTurn) {
  EXPECT_TRUE(parse("").empty());
  EXPECT_TRUE(parse("   \t ").empty());
}

TEST(Notation, ExtraWhitespaceIsIgnored) {
  auto ms = parse("  24/18   13/11 ");
  ASSERT_EQ(ms.size(), 2u);
  EXPECT_EQ(ms[1].kind, MoveKind(Normal{13, 11}));
}

TEST(Notation, Malformed) {
  EXPECT_EQ(parseError("13"), ErrorCode::MALFORMED_NOTATION);
  EXPECT_EQ(parseError("13/"), ErrorCode::MALFORMED_NOTATION);
  EXPECT_EQ(parseError("8//3"), ErrorCode::MALFORMED_NOTATION);
  EXPECT_EQ(parseError("8/x/3"), ErrorCode::MALFORMED_NOTATION);
  EXPECT_EQ(parseError("8/3a"), ErrorCode::MALFORMED_NOTATION);
  EXPECT_EQ(parseError("bar/off"), ErrorCode::MALFORMED_NOTATION);
}

TEST(Notation, InvalidPoint) {
  EXPECT_EQ(parseError("25/20"), ErrorCode::INVALID_POINT);
  EXPECT_EQ(parseError("13/0"), ErrorCode::INVALID_POINT);
  EXPECT_EQ(parseError("100/3"), ErrorCode::INVALID_POINT);
}

TEST(Notation, InvalidKeyword) {
  EXPECT_EQ(parseError("13/home"), ErrorCode::INVALID_KEYWORD);
  EXPECT_EQ(parseError("13/bar"), ErrorCode::INVALID_KEYWORD);
  EXPECT_EQ(parseError("off/3"), ErrorCode::INVALID_KEYWORD);
  EXPECT_EQ(parseError("6/off/3"), ErrorCode::INVALID_KEYWORD);
}

TEST(Notation, ErrorCarriesToken) {
  try {
    parse("13/7 30/24");
    FAIL() << "expected NotationError";
  } catch (const NotationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_POINT);
    EXPECT_EQ(e.token(), "30");
  }
}

TEST(Notation, FormatUsesKeywords) {
  EXPECT_EQ(format(parse("bar/22 6/off 8/3/1")), "bar/22 6/off 8/3 3/1");
}
