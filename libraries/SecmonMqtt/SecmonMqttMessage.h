#ifndef SECMON_MQTT_MESSAGE_H
#define SECMON_MQTT_MESSAGE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace secmon_mqtt {

struct Publication {
  std::string topic;
  std::string payload;
  bool retained = false;
};

// Called from the client loop for every incoming message. Returning true with a
// non-empty reply.topic publishes the reply.
using MessageHandler = bool (*)(const std::string &topic, const std::string &payload, Publication &reply, void *ctx);

// "<clientId>/presence"
std::string presenceTopic(const std::string &clientId);
// {"name": <clientId>, "status": <status>}
std::string presencePayload(const std::string &clientId, const char *status, size_t jsonCapacity);

// Replies produced inside the lwmqtt callback. The client is not reentrant, so
// they wait here until the yield that delivered the message has returned.
class ReplyQueue {
public:
  // Runs the handler and queues its reply. True if something was queued.
  bool dispatch(MessageHandler handler, void *ctx, const std::string &topic, const std::string &payload);

  std::vector<Publication> take();
  size_t pending() const { return _queue.size(); }

private:
  std::vector<Publication> _queue;
};

// Spaces connection attempts by delayMs. The first attempt is always due.
class ReconnectThrottle {
public:
  explicit ReconnectThrottle(uint32_t delayMs) : _delay(delayMs) {}

  bool due(std::chrono::steady_clock::time_point now);

private:
  std::chrono::milliseconds _delay;
  bool _attempted = false;
  std::chrono::steady_clock::time_point _last;
};

} // namespace secmon_mqtt

#endif
