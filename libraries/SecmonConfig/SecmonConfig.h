#ifndef SECMON_CONFIG_H
#define SECMON_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace secmon {

// mon_config.json. Keys are the snake_case forms of the field names.
struct AppConfig {
  std::string name;
  std::vector<std::string> urls;
  std::vector<std::string> tokens;

  std::string mqttBroker; // empty disables MQTT
  uint16_t mqttPort = 1883;
  uint16_t mqttTimeout = 60;
  std::string mqttUsername;
  std::string mqttPassword;

  uint32_t splitterRefreshRate = 300;
  int division = 1;
  double maxTimeDelta = 7200;
  uint32_t autoTimeout = 900;

  std::string udpBind = "0.0.0.0";
  uint16_t udpPort = 11017;

  uint32_t playTimeout = 15;
  uint32_t joinTimeout = 30;

  std::string motionPrefix = "daisy";
  std::string motionField = "ConfRm Motion";

  std::string display; // X display name, empty uses $DISPLAY
  std::string mpvPath = "mpv";
  std::string logLevel = "debug";
};

static const size_t kConfigJsonCapacity = 16384;

bool parseConfig(const std::string &json, AppConfig &out);
bool loadConfig(const std::string &path, AppConfig &out);

} // namespace secmon

#endif
