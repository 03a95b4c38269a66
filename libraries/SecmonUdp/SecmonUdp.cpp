#include "SecmonUdp.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

#include <SecmonLog.h>

namespace secmon_udp {

Listener::Listener(const Config &cfg) : _cfg(cfg) {}

Listener::~Listener() {
  stop();
  if (_sock >= 0) close(_sock);
}

void Listener::setHandler(DatagramHandler handler, void *ctx) {
  _handler = handler;
  _handlerCtx = ctx;
}

bool Listener::begin() {
  if (_sock >= 0) return true;

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(_cfg.port);
  if (inet_pton(AF_INET, _cfg.bindAddress.c_str(), &addr.sin_addr) != 1) {
    LOGE("UDP", "INVALID_ARGUMENT: bind address %s", _cfg.bindAddress.c_str());
    return false;
  }

  int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    LOGE("UDP", "socket: %s", strerror(errno));
    return false;
  }
  if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
    LOGE("UDP", "bind %s:%u: %s", _cfg.bindAddress.c_str(), (unsigned)_cfg.port, strerror(errno));
    close(fd);
    return false;
  }

  socklen_t len = sizeof(addr);
  if (getsockname(fd, (struct sockaddr *)&addr, &len) == 0) {
    _boundPort = ntohs(addr.sin_port);
  } else {
    _boundPort = _cfg.port;
  }
  _sock = fd;
  LOGI("UDP", "listening on %s:%u", _cfg.bindAddress.c_str(), (unsigned)_boundPort);
  return true;
}

bool Listener::poll() {
  if (_sock < 0) return false;

  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(_sock, &readable);
  struct timeval tv;
  tv.tv_sec = _cfg.selectTimeoutMs / 1000;
  tv.tv_usec = (long)(_cfg.selectTimeoutMs % 1000) * 1000L;

  int rc = select(_sock + 1, &readable, nullptr, nullptr, &tv);
  if (rc < 0) {
    if (errno == EINTR) return true;
    LOGE("UDP", "select: %s", strerror(errno));
    return false;
  }
  if (rc == 0) return true;

  char buffer[kMaxDatagram];
  struct sockaddr_in from;
  socklen_t fromLen = sizeof(from);
  ssize_t n = recvfrom(_sock, buffer, sizeof(buffer), 0, (struct sockaddr *)&from, &fromLen);
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) return true;
    LOGE("UDP", "recvfrom: %s", strerror(errno));
    return false;
  }

  char host[INET_ADDRSTRLEN] = "?";
  inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host));
  LOGI("UDP", "packet from %s:%u", host, (unsigned)ntohs(from.sin_port));

  const std::string text(buffer, (size_t)n);
  const bool accepted = _handler ? _handler(text, _handlerCtx) : false;
  const char *reply = accepted ? "OK" : "NO";
  if (sendto(_sock, reply, 2, 0, (struct sockaddr *)&from, fromLen) < 0) {
    LOGW("UDP", "reply to %s failed: %s", host, strerror(errno));
  }
  return true;
}

bool Listener::start() {
  if (_sock < 0 || _thread.joinable()) return false;
  _stop.clear();
  _thread = std::thread([this] {
    while (!_stop.isSet()) {
      if (!poll()) break;
    }
    LOGD("UDP", "listener stopped");
  });
  return true;
}

void Listener::stop() {
  _stop.set();
  if (_thread.joinable()) _thread.join();
}

} // namespace secmon_udp
