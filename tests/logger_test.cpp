#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <vector>

#include "logger.hpp"
#include "game.hpp"

using namespace BGE;

namespace {

std::string tempPath(const std::string& name) {
  std::filesystem::path p = std::filesystem::path(testing::TempDir()) / "bge_logger_test" / name;
  std::filesystem::remove(p);
  return p.string();
}

std::vector<std::string> readLines(const std::string& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string l;
  while (std::getline(in, l)) lines.push_back(l);
  return lines;
}

} // namespace

TEST(Logger, WritesOneLinePerRecord) {
  const std::string path = tempPath("format.log");
  {
    Logger log(path);
    ASSERT_TRUE(log.ok());
    log.info(EventType::Roll, "WHITE", "6-1");
    log.error("", "bad input");
    EXPECT_EQ(log.written(), 2ul);
  }

  std::vector<std::string> lines = readLines(path);
  ASSERT_EQ(lines.size(), 2u);

  const std::regex line(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z \| Roll \| WHITE \| 6-1$)");
  EXPECT_TRUE(std::regex_match(lines[0], line)) << lines[0];
  EXPECT_NE(lines[1].find(" | Error | - | bad input"), std::string::npos) << lines[1];
}

TEST(Logger, UnopenablePathDropsWrites) {
  Logger log(testing::TempDir());  // a directory
  EXPECT_FALSE(log.ok());
  log.info(EventType::System, "", "ignored");
  EXPECT_EQ(log.written(), 0ul);
}

TEST(Logger, GameEventsAreLogged) {
  const std::string path = tempPath("game.log");
  {
    Logger log(path);
    Game g(&log);
    ASSERT_TRUE(g.setOpeningDice(6, 1));
    EXPECT_FALSE(g.submitTurn("13/7"));
    ASSERT_TRUE(g.submitTurn("13/7 8/7"));
  }

  std::vector<std::string> lines = readLines(path);
  auto count = [&](const std::string& needle) {
    int n=0;
    for (const std::string& l : lines) if (l.find(needle)!=std::string::npos) ++n;
    return n;
  };
  EXPECT_EQ(count(" | GameStart | "), 1);
  EXPECT_EQ(count(" | OpeningRoll | "), 1);
  EXPECT_EQ(count(" | TurnRejected | WHITE | INCOMPLETE_TURN"), 1);
  EXPECT_EQ(count(" | Move | WHITE | "), 2);
  EXPECT_EQ(count(" | TurnAccepted | WHITE | 13/7 8/7"), 1);
}

TEST(Logger, LineFormat) {
  EXPECT_EQ(Logger::line({EventType::Move, "BLACK", "bar/22*"}, "2024-01-02T03:04:05.000006Z"),
            "2024-01-02T03:04:05.000006Z | Move | BLACK | bar/22*");
  EXPECT_EQ(Logger::line({EventType::System, "", "up"}, "T"), "T | System | - | up");
}

TEST(Logger, TypeNames) {
  EXPECT_STREQ(Logger::type_name(EventType::TurnForfeited), "TurnForfeited");
  EXPECT_STREQ(Logger::type_name(EventType::GameOver), "GameOver");
}
