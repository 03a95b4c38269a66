#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <SecmonConfig.h>

using namespace secmon;

static const char *kMinimal = R"({"name": "secmon00", "urls": ["rtsp://a"], "tokens": []})";

TEST(Config, MinimalUsesDefaults) {
  AppConfig c;
  ASSERT_TRUE(parseConfig(kMinimal, c));
  EXPECT_EQ(c.name, "secmon00");
  ASSERT_EQ(c.urls.size(), 1u);
  EXPECT_TRUE(c.tokens.empty());
  EXPECT_TRUE(c.mqttBroker.empty());
  EXPECT_EQ(c.mqttPort, 1883);
  EXPECT_EQ(c.mqttTimeout, 60);
  EXPECT_EQ(c.splitterRefreshRate, 300u);
  EXPECT_EQ(c.division, 1);
  EXPECT_DOUBLE_EQ(c.maxTimeDelta, 7200);
  EXPECT_EQ(c.autoTimeout, 900u);
  EXPECT_EQ(c.udpBind, "0.0.0.0");
  EXPECT_EQ(c.udpPort, 11017);
  EXPECT_EQ(c.motionPrefix, "daisy");
  EXPECT_EQ(c.motionField, "ConfRm Motion");
  EXPECT_EQ(c.mpvPath, "mpv");
  EXPECT_EQ(c.logLevel, "debug");
}

TEST(Config, FullDocument) {
  const char *json = R"({
    "name": "wall",
    "urls": ["rtsp://a", "rtsp://b", "rtsp://c", "rtsp://d", "rtsp://e"],
    "tokens": ["magld_AP8QBDTScQ"],
    "mqtt_broker": "10.0.0.2",
    "mqtt_port": 8883,
    "mqtt_username": "wall",
    "mqtt_password": "pw",
    "splitter_refresh_rate": 60,
    "division": 2,
    "max_time_delta": 30.5,
    "auto_timeout": 120,
    "udp_port": 0,
    "display": ":1",
    "log_level": "WARN"
  })";
  AppConfig c;
  ASSERT_TRUE(parseConfig(json, c));
  EXPECT_EQ(c.urls.size(), 5u);
  EXPECT_EQ(c.tokens[0], "magld_AP8QBDTScQ");
  EXPECT_EQ(c.mqttBroker, "10.0.0.2");
  EXPECT_EQ(c.mqttPort, 8883);
  EXPECT_EQ(c.mqttPassword, "pw");
  EXPECT_EQ(c.splitterRefreshRate, 60u);
  EXPECT_EQ(c.division, 2);
  EXPECT_DOUBLE_EQ(c.maxTimeDelta, 30.5);
  EXPECT_EQ(c.autoTimeout, 120u);
  EXPECT_EQ(c.udpPort, 0);
  EXPECT_EQ(c.display, ":1");
  EXPECT_EQ(c.logLevel, "WARN");
}

TEST(Config, RequiredKeys) {
  AppConfig c;
  EXPECT_FALSE(parseConfig(R"({"urls": ["rtsp://a"], "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "", "urls": ["rtsp://a"], "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": [], "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"]})", c));
}

TEST(Config, TypeAndRangeErrors) {
  AppConfig c;
  EXPECT_FALSE(parseConfig(R"({"name": 5, "urls": ["rtsp://a"], "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a", 3], "tokens": []})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "mqtt_port": "1883"})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "mqtt_port": 70000})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "division": 1.5})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "division": -1})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "auto_timeout": true})", c));
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "log_level": "loud"})", c));
  EXPECT_FALSE(parseConfig("[1, 2]", c));
  EXPECT_FALSE(parseConfig("{\"name\": ", c));
}

TEST(Config, FailureLeavesOutputUntouched) {
  AppConfig c;
  c.name = "previous";
  EXPECT_FALSE(parseConfig(R"({"name": "x", "urls": ["rtsp://a"], "tokens": [], "udp_port": -4})", c));
  EXPECT_EQ(c.name, "previous");
}

TEST(Config, LoadFromFile) {
  char path[] = "/tmp/secmon_config_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  close(fd);
  {
    std::ofstream out(path);
    out << kMinimal;
  }
  AppConfig c;
  EXPECT_TRUE(loadConfig(path, c));
  EXPECT_EQ(c.name, "secmon00");
  std::remove(path);

  EXPECT_FALSE(loadConfig(path, c));
}
