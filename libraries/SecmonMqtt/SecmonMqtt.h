#ifndef SECMON_MQTT_H
#define SECMON_MQTT_H

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

extern "C" {
#include <lwmqtt.h>
#include <lwmqtt/unix.h>
}

#include <SecmonMqttMessage.h>
#include <SecmonSync.h>

namespace secmon_mqtt {

struct Config {
  std::string brokerHost;
  uint16_t brokerPort = 1883;
  std::string username;
  std::string password;

  std::string clientId;

  uint16_t keepAliveSeconds = 60;
  uint32_t reconnectDelayMs = 1000;
  uint32_t commandTimeoutMs = 1000;
  uint32_t loopIntervalMs = 100;

  size_t bufferSize = 2048;
  size_t txJsonCapacity = 256;
};

class Client {
public:
  explicit Client(const Config &cfg);
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  bool begin();
  void loop();

  void setMessageHandler(MessageHandler handler, void *ctx = nullptr);
  // Subscribed (QoS 0) on every connect.
  void addSubscription(const std::string &topic);

  bool isConnected() const { return _connected; }

  bool publish(const std::string &topic, const std::string &payload, bool retained);
  bool publishPresence(const char *status);

  std::string topicPresence() const { return presenceTopic(_cfg.clientId); }

  // Runs loop() on its own thread until stop().
  bool start();
  void stop();

private:
  void ensureConnected();
  void drop(const char *why, lwmqtt_err_t err);
  void flushReplies();

  Config _cfg;
  bool _begun = false;

  lwmqtt_unix_network_t _net;
  lwmqtt_unix_timer_t _keepAliveTimer;
  lwmqtt_unix_timer_t _commandTimer;
  lwmqtt_client_t _client;
  std::vector<uint8_t> _writeBuf;
  std::vector<uint8_t> _readBuf;
  bool _connected = false;
  ReconnectThrottle _throttle;

  std::vector<std::string> _subscriptions;
  ReplyQueue _replies;

  MessageHandler _handler = nullptr;
  void *_handlerCtx = nullptr;

  secmon::Event _stop;
  std::thread _thread;

  static void mqttThunk(lwmqtt_client_t *client, void *ref, lwmqtt_string_t topic, lwmqtt_message_t msg);
};

} // namespace secmon_mqtt

#endif
