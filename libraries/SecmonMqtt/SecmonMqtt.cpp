#include "SecmonMqtt.h"

#include <SecmonLog.h>

namespace secmon_mqtt {

static lwmqtt_string_t lw_string(const std::string &s) {
  lwmqtt_string_t out = lwmqtt_default_string;
  out.len = (uint16_t)s.size();
  out.data = const_cast<char *>(s.data());
  return out;
}

Client::Client(const Config &cfg) : _cfg(cfg), _throttle(cfg.reconnectDelayMs) {}

Client::~Client() { stop(); }

bool Client::begin() {
  if (_cfg.brokerHost.empty() || _cfg.clientId.empty()) {
    LOGE("MQTT", "INVALID_ARGUMENT: broker host and client id are required");
    return false;
  }
  if (_begun) return true;

  _writeBuf.assign(_cfg.bufferSize, 0);
  _readBuf.assign(_cfg.bufferSize, 0);

  lwmqtt_init(&_client, _writeBuf.data(), _writeBuf.size(), _readBuf.data(), _readBuf.size());
  lwmqtt_set_network(&_client, &_net, lwmqtt_unix_network_read, lwmqtt_unix_network_write);
  lwmqtt_set_timers(&_client, &_keepAliveTimer, &_commandTimer, lwmqtt_unix_timer_set, lwmqtt_unix_timer_get);
  lwmqtt_set_callback(&_client, this, mqttThunk);

  _begun = true;
  return true;
}

void Client::setMessageHandler(MessageHandler handler, void *ctx) {
  _handler = handler;
  _handlerCtx = ctx;
}

void Client::addSubscription(const std::string &topic) { _subscriptions.push_back(topic); }

void Client::drop(const char *why, lwmqtt_err_t err) {
  LOGW("MQTT", "%s failed (%d), dropping connection", why, (int)err);
  lwmqtt_unix_network_disconnect(&_net);
  _connected = false;
}

void Client::ensureConnected() {
  if (_connected) return;

  if (!_throttle.due(std::chrono::steady_clock::now())) return;

  lwmqtt_err_t err = lwmqtt_unix_network_connect(&_net, const_cast<char *>(_cfg.brokerHost.c_str()), _cfg.brokerPort);
  if (err != LWMQTT_SUCCESS) {
    LOGW("MQTT", "cannot reach %s:%u (%d)", _cfg.brokerHost.c_str(), (unsigned)_cfg.brokerPort, (int)err);
    return;
  }

  const std::string willTopic = topicPresence();
  const std::string willPayload = presencePayload(_cfg.clientId, "OFFLINE", _cfg.txJsonCapacity);
  lwmqtt_will_t will = lwmqtt_default_will;
  will.topic = lw_string(willTopic);
  will.payload = lw_string(willPayload);
  will.qos = LWMQTT_QOS1;
  will.retained = true;

  lwmqtt_connect_options_t options = lwmqtt_default_connect_options;
  options.client_id = lw_string(_cfg.clientId);
  options.keep_alive = _cfg.keepAliveSeconds;
  options.clean_session = true;
  if (!_cfg.username.empty()) {
    options.username = lw_string(_cfg.username);
    if (!_cfg.password.empty()) options.password = lw_string(_cfg.password);
  }

  err = lwmqtt_connect(&_client, &options, &will, _cfg.commandTimeoutMs);
  if (err != LWMQTT_SUCCESS) {
    LOGW("MQTT", "connect refused (%d, return code %d)", (int)err, (int)options.return_code);
    lwmqtt_unix_network_disconnect(&_net);
    return;
  }
  _connected = true;
  LOGI("MQTT", "connected to %s:%u as %s", _cfg.brokerHost.c_str(), (unsigned)_cfg.brokerPort, _cfg.clientId.c_str());

  for (size_t i = 0; i < _subscriptions.size(); i++) {
    err = lwmqtt_subscribe_one(&_client, lw_string(_subscriptions[i]), LWMQTT_QOS0, _cfg.commandTimeoutMs);
    if (err != LWMQTT_SUCCESS) {
      drop("subscribe", err);
      return;
    }
    LOGD("MQTT", "subscribed to %s", _subscriptions[i].c_str());
  }
  publishPresence("ONLINE");
}

bool Client::publish(const std::string &topic, const std::string &payload, bool retained) {
  if (!_connected) return false;

  lwmqtt_message_t msg = lwmqtt_default_message;
  msg.qos = retained ? LWMQTT_QOS1 : LWMQTT_QOS0;
  msg.retained = retained;
  msg.payload = (uint8_t *)payload.data();
  msg.payload_len = payload.size();

  lwmqtt_publish_options_t options = lwmqtt_default_publish_options;
  lwmqtt_err_t err = lwmqtt_publish(&_client, &options, lw_string(topic), msg, _cfg.commandTimeoutMs);
  if (err != LWMQTT_SUCCESS) {
    drop("publish", err);
    return false;
  }
  return true;
}

bool Client::publishPresence(const char *status) {
  return publish(topicPresence(), presencePayload(_cfg.clientId, status, _cfg.txJsonCapacity), true);
}

void Client::mqttThunk(lwmqtt_client_t *client, void *ref, lwmqtt_string_t topic, lwmqtt_message_t msg) {
  (void)client;
  Client *self = (Client *)ref;
  if (!self) return;
  self->_replies.dispatch(self->_handler, self->_handlerCtx, std::string(topic.data, topic.len),
                          std::string((const char *)msg.payload, msg.payload_len));
}

void Client::flushReplies() {
  std::vector<Publication> pending = _replies.take();
  for (size_t i = 0; i < pending.size(); i++) {
    if (!publish(pending[i].topic, pending[i].payload, pending[i].retained)) break;
  }
}

void Client::loop() {
  if (!_begun) return;
  ensureConnected();
  if (!_connected) return;

  bool readable = false;
  lwmqtt_err_t err = lwmqtt_unix_network_select(&_net, &readable, _cfg.loopIntervalMs);
  if (err != LWMQTT_SUCCESS) {
    drop("select", err);
    return;
  }
  if (readable) {
    size_t available = 0;
    err = lwmqtt_unix_network_peek(&_net, &available);
    if (err != LWMQTT_SUCCESS || available == 0) {
      drop("read", err);
      return;
    }
    err = lwmqtt_yield(&_client, available, _cfg.commandTimeoutMs);
    if (err != LWMQTT_SUCCESS) {
      drop("yield", err);
      return;
    }
    flushReplies();
    if (!_connected) return;
  }

  err = lwmqtt_keep_alive(&_client, _cfg.commandTimeoutMs);
  if (err != LWMQTT_SUCCESS) drop("keep alive", err);
}

bool Client::start() {
  if (!_begun || _thread.joinable()) return false;
  _stop.clear();
  _thread = std::thread([this] {
    while (!_stop.isSet()) {
      loop();
      if (!_connected) _stop.waitFor(_cfg.loopIntervalMs);
    }
  });
  return true;
}

void Client::stop() {
  _stop.set();
  if (_thread.joinable()) _thread.join();

  if (_connected) {
    publishPresence("OFFLINE");
    if (_connected) {
      lwmqtt_disconnect(&_client, _cfg.commandTimeoutMs);
      lwmqtt_unix_network_disconnect(&_net);
      _connected = false;
    }
    LOGI("MQTT", "disconnected");
  }
}

} // namespace secmon_mqtt
