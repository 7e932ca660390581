#include <gtest/gtest.h>
#include <cstdlib>
#include "config.hpp"

using namespace MS;

namespace {

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }
  static void clear() {
    for (const char* k : {"MS_LISTEN_ADDR", "MS_LOG_PATH", "MS_MAILBOX_CAPACITY", "MS_REGISTER_POLL_MS"})
      unsetenv(k);
  }
};

} // anon

TEST(ParsePositive, AcceptsAndRejects) {
  unsigned long v = 0;
  EXPECT_TRUE(parsePositive("42", v));
  EXPECT_EQ(v, 42ul);
  EXPECT_FALSE(parsePositive("0", v));
  EXPECT_FALSE(parsePositive("-3", v));
  EXPECT_FALSE(parsePositive("12abc", v));
  EXPECT_FALSE(parsePositive("", v));
  EXPECT_FALSE(parsePositive("99999999999999999999999999", v));
}

TEST_F(ConfigTest, Defaults) {
  ServerConfig cfg;
  std::string err;
  char prog[] = "masterserver";
  char* argv[] = {prog, nullptr};
  ASSERT_TRUE(loadConfig(1, argv, cfg, err)) << err;
  EXPECT_EQ(cfg.listen_addr, "0.0.0.0:50051");
  EXPECT_EQ(cfg.log_path, "logs/masterserver.log");
  EXPECT_EQ(cfg.mailbox_capacity, 1024u);
  EXPECT_EQ(cfg.register_poll.count(), 200);
}

TEST_F(ConfigTest, EnvironmentThenArgv) {
  setenv("MS_LISTEN_ADDR", "127.0.0.1:6000", 1);
  setenv("MS_LOG_PATH", "/tmp/ms.log", 1);
  setenv("MS_MAILBOX_CAPACITY", "16", 1);
  setenv("MS_REGISTER_POLL_MS", "50", 1);

  ServerConfig cfg;
  std::string err;
  char prog[] = "masterserver";
  char* argv1[] = {prog, nullptr};
  ASSERT_TRUE(loadConfig(1, argv1, cfg, err)) << err;
  EXPECT_EQ(cfg.listen_addr, "127.0.0.1:6000");
  EXPECT_EQ(cfg.log_path, "/tmp/ms.log");
  EXPECT_EQ(cfg.mailbox_capacity, 16u);
  EXPECT_EQ(cfg.register_poll.count(), 50);

  char addr[] = "0.0.0.0:7000";
  char* argv2[] = {prog, addr, nullptr};
  ASSERT_TRUE(loadConfig(2, argv2, cfg, err)) << err;
  EXPECT_EQ(cfg.listen_addr, "0.0.0.0:7000");
}

TEST_F(ConfigTest, MalformedNumberIsReported) {
  setenv("MS_MAILBOX_CAPACITY", "lots", 1);
  ServerConfig cfg;
  std::string err;
  char prog[] = "masterserver";
  char* argv[] = {prog, nullptr};
  EXPECT_FALSE(loadConfig(1, argv, cfg, err));
  EXPECT_NE(err.find("MS_MAILBOX_CAPACITY"), std::string::npos);
}
