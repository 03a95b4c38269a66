#ifndef SECMON_REMOTE_H
#define SECMON_REMOTE_H

#include <string>
#include <vector>

#include <SecmonMonitor.h>
#include <SecmonMqttMessage.h>

namespace secmon {

struct RemoteConfig {
  std::string name;
  std::string motionPrefix = "daisy";
  std::string motionField = "ConfRm Motion";
  size_t jsonCapacity = 1024;
};

// Maps transport traffic onto Monitor operations.
class Remote {
public:
  static const char *const kCheckupRequestTopic;
  static const char *const kCheckupTopic;

  Remote(const RemoteConfig &cfg, Monitor &monitor);

  std::string commandTopic() const { return _cfg.name + "/cmd"; }
  std::vector<std::string> topics() const;

  bool handleMessage(const std::string &topic, const std::string &payload, secmon_mqtt::Publication &reply);
  bool handleDatagram(const std::string &text);

  std::string checkupPayload() const;

  static bool mqttThunk(const std::string &topic, const std::string &payload, secmon_mqtt::Publication &reply, void *ctx);
  static bool udpThunk(const std::string &text, void *ctx);

private:
  void handleMotion(const std::string &topic, const std::string &payload);

  RemoteConfig _cfg;
  Monitor &_monitor;
};

} // namespace secmon

#endif
