#ifndef SECMON_UDP_H
#define SECMON_UDP_H

#include <cstdint>
#include <string>
#include <thread>

#include <SecmonSync.h>

namespace secmon_udp {

struct Config {
  std::string bindAddress = "0.0.0.0";
  uint16_t port = 11017; // 0 picks a free port
  uint32_t selectTimeoutMs = 1000;
};

// Returns the acknowledgment: true -> "OK", false -> "NO".
using DatagramHandler = bool (*)(const std::string &text, void *ctx);

class Listener {
public:
  static const size_t kMaxDatagram = 1024;

  explicit Listener(const Config &cfg);
  ~Listener();

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;

  bool begin();
  void setHandler(DatagramHandler handler, void *ctx = nullptr);

  // Waits up to selectTimeoutMs for one datagram and answers it.
  // False once the socket is unusable.
  bool poll();

  uint16_t boundPort() const { return _boundPort; }

  bool start();
  void stop();

private:
  Config _cfg;
  int _sock = -1;
  uint16_t _boundPort = 0;

  DatagramHandler _handler = nullptr;
  void *_handlerCtx = nullptr;

  secmon::Event _stop;
  std::thread _thread;
};

} // namespace secmon_udp

#endif
