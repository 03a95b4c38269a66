#include "SecmonMqttMessage.h"

#include <ArduinoJson.h>

#include <SecmonLog.h>

namespace secmon_mqtt {

std::string presenceTopic(const std::string &clientId) { return clientId + "/presence"; }

std::string presencePayload(const std::string &clientId, const char *status, size_t jsonCapacity) {
  DynamicJsonDocument doc(jsonCapacity);
  doc["name"] = clientId;
  doc["status"] = status;
  std::string payload;
  serializeJson(doc, payload);
  return payload;
}

bool ReplyQueue::dispatch(MessageHandler handler, void *ctx, const std::string &topic, const std::string &payload) {
  if (!handler) {
    LOGD("MQTT", "no handler for %s", topic.c_str());
    return false;
  }
  Publication reply;
  if (!handler(topic, payload, reply, ctx) || reply.topic.empty()) return false;
  _queue.push_back(reply);
  return true;
}

std::vector<Publication> ReplyQueue::take() {
  std::vector<Publication> out;
  out.swap(_queue);
  return out;
}

bool ReconnectThrottle::due(std::chrono::steady_clock::time_point now) {
  if (_attempted && now - _last < _delay) return false;
  _attempted = true;
  _last = now;
  return true;
}

} // namespace secmon_mqtt
