#include "SecmonRemote.h"

#include <ArduinoJson.h>

#include <SecmonLog.h>

namespace secmon {

const char *const Remote::kCheckupRequestTopic = "reporter/checkup_req";
const char *const Remote::kCheckupTopic = "reporter/checkup";

static bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

Remote::Remote(const RemoteConfig &cfg, Monitor &monitor) : _cfg(cfg), _monitor(monitor) {}

std::vector<std::string> Remote::topics() const {
  std::vector<std::string> t;
  t.push_back(kCheckupRequestTopic);
  t.push_back(commandTopic());
  t.push_back(_cfg.motionPrefix + "/event");
  t.push_back(_cfg.motionPrefix + "/checkup");
  return t;
}

std::string Remote::checkupPayload() const {
  MonitorStatus st = _monitor.status();

  DynamicJsonDocument doc(_cfg.jsonCapacity);
  doc["name"] = _cfg.name;
  doc["state"] = monitorStateStr(st.state);
  doc["auto"] = st.autoMode;
  doc["display_off"] = st.displayOff;
  doc["tokens"] = (uint32_t)st.tokens;
  doc["uptime_s"] = st.uptimeS;

  std::string payload;
  serializeJson(doc, payload);
  return payload;
}

void Remote::handleMotion(const std::string &topic, const std::string &payload) {
  LOGD("REMOTE", "%s: %s", topic.c_str(), payload.c_str());

  DynamicJsonDocument doc(_cfg.jsonCapacity);
  DeserializationError err = deserializeJson(doc, payload);
  if (err) {
    LOGD("REMOTE", "%s: not json (%s)", topic.c_str(), err.c_str());
    return;
  }
  const JsonDocument &cdoc = doc;
  JsonVariantConst v = cdoc[_cfg.motionField];
  bool motion = false;
  if (v.is<bool>()) {
    motion = v.as<bool>();
  } else if (v.is<double>()) {
    motion = v.as<double>() != 0;
  }
  if (motion) {
    LOGI("REMOTE", "motion received");
    _monitor.noteMotion();
  }
}

bool Remote::handleMessage(const std::string &topic, const std::string &payload, secmon_mqtt::Publication &reply) {
  if (topic == kCheckupRequestTopic) {
    LOGI("REMOTE", "checkup requested");
    reply.topic = kCheckupTopic;
    reply.payload = checkupPayload();
    reply.retained = false;
    return true;
  }
  if (topic == commandTopic()) {
    LOGI("REMOTE", "display commanded: %s", payload.c_str());
    _monitor.applyCommand(payload);
    return false;
  }
  if (starts_with(topic, _cfg.motionPrefix)) {
    handleMotion(topic, payload);
    return false;
  }
  LOGD("REMOTE", "unhandled topic %s", topic.c_str());
  return false;
}

bool Remote::handleDatagram(const std::string &text) {
  LOGD("REMOTE", "datagram: %s", text.c_str());
  return _monitor.applyCommand(text);
}

bool Remote::mqttThunk(const std::string &topic, const std::string &payload, secmon_mqtt::Publication &reply, void *ctx) {
  Remote *self = static_cast<Remote *>(ctx);
  if (!self) return false;
  return self->handleMessage(topic, payload, reply);
}

bool Remote::udpThunk(const std::string &text, void *ctx) {
  Remote *self = static_cast<Remote *>(ctx);
  if (!self) return false;
  return self->handleDatagram(text);
}

} // namespace secmon
