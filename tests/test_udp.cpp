#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <SecmonUdp.h>

using secmon_udp::Config;
using secmon_udp::Listener;

namespace {

struct Received {
  std::mutex mu;
  std::vector<std::string> texts;
};

bool accept_ok(const std::string &text, void *ctx) {
  Received *r = static_cast<Received *>(ctx);
  std::lock_guard<std::mutex> lock(r->mu);
  r->texts.push_back(text);
  return text.find("ok") != std::string::npos;
}

// Sends text to 127.0.0.1:port and returns the reply ("" on timeout).
std::string exchange(uint16_t port, const std::string &text) {
  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) return "";
  struct timeval tv;
  tv.tv_sec = 3;
  tv.tv_usec = 0;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  struct sockaddr_in to;
  memset(&to, 0, sizeof(to));
  to.sin_family = AF_INET;
  to.sin_port = htons(port);
  to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  std::string reply;
  if (sendto(fd, text.data(), text.size(), 0, (struct sockaddr *)&to, sizeof(to)) == (ssize_t)text.size()) {
    char buf[16];
    ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n > 0) reply.assign(buf, (size_t)n);
  }
  close(fd);
  return reply;
}

Config loopback() {
  Config c;
  c.bindAddress = "127.0.0.1";
  c.port = 0;
  c.selectTimeoutMs = 50;
  return c;
}

} // namespace

TEST(Udp, RejectsBadBindAddress) {
  Config c = loopback();
  c.bindAddress = "not-an-address";
  Listener l(c);
  EXPECT_FALSE(l.begin());
  EXPECT_FALSE(l.start());
}

TEST(Udp, AnswersOkOrNo) {
  Received r;
  Listener l(loopback());
  ASSERT_TRUE(l.begin());
  ASSERT_NE(l.boundPort(), 0);
  l.setHandler(accept_ok, &r);
  ASSERT_TRUE(l.start());

  EXPECT_EQ(exchange(l.boundPort(), "looks ok"), "OK");
  EXPECT_EQ(exchange(l.boundPort(), "nope"), "NO");
  l.stop();

  std::lock_guard<std::mutex> lock(r.mu);
  ASSERT_EQ(r.texts.size(), 2u);
  EXPECT_EQ(r.texts[0], "looks ok");
  EXPECT_EQ(r.texts[1], "nope");
}

TEST(Udp, NoHandlerAnswersNo) {
  Listener l(loopback());
  ASSERT_TRUE(l.begin());
  ASSERT_TRUE(l.start());
  EXPECT_FALSE(l.start());
  EXPECT_EQ(exchange(l.boundPort(), "anything ok"), "NO");
}

TEST(Udp, PollTimesOutQuietly) {
  Listener l(loopback());
  ASSERT_TRUE(l.begin());
  EXPECT_TRUE(l.poll());
}
