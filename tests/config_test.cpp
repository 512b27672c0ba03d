#include <gtest/gtest.h>

#include "config.hpp"

using namespace BGE;

TEST(Config, Defaults) {
  Config c = parseConfig({}, nullptr);
  EXPECT_FALSE(c.plain);
  EXPECT_FALSE(c.help);
  EXPECT_FALSE(c.seed.has_value());
  EXPECT_TRUE(c.logPath.empty());
}

TEST(Config, AllOptions) {
  Config c = parseConfig({"--plain", "--seed", "17", "--log", "/tmp/bg.log"}, nullptr);
  EXPECT_TRUE(c.plain);
  ASSERT_TRUE(c.seed.has_value());
  EXPECT_EQ(*c.seed, 17u);
  EXPECT_EQ(c.logPath, "/tmp/bg.log");
}

TEST(Config, EnvironmentLogIsFallback) {
  EXPECT_EQ(parseConfig({}, "env.log").logPath, "env.log");
  EXPECT_EQ(parseConfig({"--log", "arg.log"}, "env.log").logPath, "arg.log");
  EXPECT_TRUE(parseConfig({}, "").logPath.empty());
}

TEST(Config, BadArgumentsThrow) {
  EXPECT_THROW(parseConfig({"--colour"}, nullptr), std::invalid_argument);
  EXPECT_THROW(parseConfig({"--seed"}, nullptr), std::invalid_argument);
  EXPECT_THROW(parseConfig({"--seed", "-3"}, nullptr), std::invalid_argument);
  EXPECT_THROW(parseConfig({"--seed", "12x"}, nullptr), std::invalid_argument);
  EXPECT_THROW(parseConfig({"--seed", "99999999999"}, nullptr), std::invalid_argument);
  EXPECT_THROW(parseConfig({"--log"}, nullptr), std::invalid_argument);
}

TEST(Config, Help) {
  EXPECT_TRUE(parseConfig({"--help"}, nullptr).help);
  EXPECT_NE(usage("bgplay").find("--seed"), std::string::npos);
}
