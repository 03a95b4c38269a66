#include "SecmonEngine.h"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <cstring>
#include <vector>

#include <ArduinoJson.h>

#include <SecmonLog.h>

extern char **environ;

namespace secmon {

static std::atomic<unsigned> g_ipc_seq{0};

static uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

static void sleep_ms(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = ms / 1000;
  ts.tv_nsec = (long)(ms % 1000) * 1000000L;
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

const char *playWaitStr(PlayWait w) {
  switch (w) {
  case PlayWait::Playing:
    return "playing";
  case PlayWait::Timeout:
    return "timeout";
  case PlayWait::Error:
    return "error";
  }
  return "?";
}

std::unique_ptr<RenderEngine> MpvEngine::create(void *ctx) {
  (void)ctx;
  return std::unique_ptr<RenderEngine>(new MpvEngine());
}

MpvEngine::~MpvEngine() {
  if (_pid.load() > 0) {
    kill();
    reap(kStopGraceMs);
  }
  closeIpc();
}

bool MpvEngine::configure(const EngineOptions &opts) {
  if (_pid.load() > 0) return false;
  if (opts.url.empty() || opts.geometry.empty()) return false;
  _opts = opts;
  _configured = true;
  return true;
}

bool MpvEngine::start() {
  if (!_configured || _pid.load() > 0) return false;

  _sockPath = _opts.ipcDir + "/secmon-" + std::to_string(getpid()) + "-" + std::to_string(g_ipc_seq++) + ".sock";
  unlink(_sockPath.c_str());

  std::vector<std::string> args;
  args.push_back(_opts.mpvPath);
  args.push_back("--no-terminal");
  args.push_back("--no-border");
  args.push_back("--no-keepaspect");
  args.push_back("--force-window=yes");
  args.push_back("--geometry=" + _opts.geometry);
  args.push_back("--network-timeout=" + std::to_string(_opts.networkTimeoutS));
  if (!_opts.profile.empty()) args.push_back("--profile=" + _opts.profile);
  if (!_opts.audioOutput.empty()) args.push_back("--ao=" + _opts.audioOutput);
  args.push_back("--input-ipc-server=" + _sockPath);
  args.push_back("--");
  args.push_back(_opts.url);

  std::vector<char *> argv;
  for (size_t i = 0; i < args.size(); i++) argv.push_back(const_cast<char *>(args[i].c_str()));
  argv.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, _opts.mpvPath.c_str(), nullptr, nullptr, argv.data(), environ);
  if (rc != 0) {
    LOGE("ENGINE", "%s: spawn %s failed: %s", _opts.name.c_str(), _opts.mpvPath.c_str(), strerror(rc));
    return false;
  }
  _pid.store(pid);
  LOGD("ENGINE", "%s: mpv pid %d geometry %s", _opts.name.c_str(), (int)pid, _opts.geometry.c_str());
  return true;
}

bool MpvEngine::connectIpc() {
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return false;

  struct sockaddr_un addr;
  memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (_sockPath.size() >= sizeof(addr.sun_path)) {
    close(fd);
    return false;
  }
  memcpy(addr.sun_path, _sockPath.c_str(), _sockPath.size());

  if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
    close(fd);
    return false;
  }
  _ipc = fd;
  _rx.clear();
  return true;
}

bool MpvEngine::sendIpc(const char *line) {
  if (_ipc < 0) return false;
  size_t len = strlen(line);
  size_t off = 0;
  while (off < len) {
    ssize_t n = send(_ipc, line + off, len - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += (size_t)n;
  }
  return true;
}

int MpvEngine::readIpcLine(std::string &line, uint32_t timeoutMs) {
  for (;;) {
    size_t nl = _rx.find('\n');
    if (nl != std::string::npos) {
      line = _rx.substr(0, nl);
      _rx.erase(0, nl + 1);
      return 1;
    }

    struct pollfd pfd;
    pfd.fd = _ipc;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = poll(&pfd, 1, (int)timeoutMs);
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return rc == 0 ? 0 : -1;

    char buf[1024];
    ssize_t n = recv(_ipc, buf, sizeof(buf), 0);
    if (n <= 0) return -1;
    _rx.append(buf, (size_t)n);
    // only the next poll may block; keep the wait bounded to the caller's timeout
    timeoutMs = 0;
  }
}

void MpvEngine::closeIpc() {
  if (_ipc >= 0) {
    close(_ipc);
    _ipc = -1;
  }
  if (!_sockPath.empty()) {
    unlink(_sockPath.c_str());
    _sockPath.clear();
  }
}

PlayWait MpvEngine::waitUntilPlaying(uint32_t timeoutMs) {
  const uint64_t deadline = monotonic_ms() + timeoutMs;
  bool observing = false;

  while (monotonic_ms() < deadline) {
    if (!isAlive()) return PlayWait::Error;

    if (_ipc < 0) {
      if (!connectIpc()) {
        sleep_ms(kIpcPollMs);
        continue;
      }
    }
    if (!observing) {
      if (!sendIpc("{\"command\":[\"observe_property\",1,\"core-idle\"]}\n")) return PlayWait::Error;
      observing = true;
    }

    std::string line;
    int rc = readIpcLine(line, kIpcPollMs);
    if (rc < 0) return PlayWait::Error;
    if (rc == 0) continue;

    DynamicJsonDocument doc(1024);
    if (deserializeJson(doc, line)) continue;
    const JsonDocument &msg = doc;
    const char *event = msg["event"] | "";
    if (strcmp(event, "property-change") == 0) {
      const char *name = msg["name"] | "";
      JsonVariantConst data = msg["data"];
      if (strcmp(name, "core-idle") == 0 && data.is<bool>() && !data.as<bool>()) return PlayWait::Playing;
    } else if (strcmp(event, "end-file") == 0) {
      const char *reason = msg["reason"] | "";
      LOGW("ENGINE", "%s: end-file (%s) before playing", _opts.name.c_str(), reason);
      return PlayWait::Error;
    } else if (strcmp(event, "shutdown") == 0) {
      return PlayWait::Error;
    }
  }
  return PlayWait::Timeout;
}

bool MpvEngine::isAlive() {
  pid_t pid = _pid.load();
  if (pid <= 0) return false;

  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == 0) return true;
  if (rc == pid) {
    if (WIFEXITED(status)) {
      LOGD("ENGINE", "%s: mpv exited with %d", _opts.name.c_str(), WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
      LOGD("ENGINE", "%s: mpv killed by signal %d", _opts.name.c_str(), WTERMSIG(status));
    }
  }
  _pid.store(-1);
  return false;
}

bool MpvEngine::reap(uint32_t timeoutMs) {
  const uint64_t deadline = monotonic_ms() + timeoutMs;
  for (;;) {
    if (!isAlive()) return true;
    if (monotonic_ms() >= deadline) return false;
    sleep_ms(50);
  }
}

void MpvEngine::stop() {
  if (_pid.load() > 0) {
    if (!sendIpc("{\"command\":[\"quit\"]}\n") || !reap(kStopGraceMs)) {
      pid_t pid = _pid.load();
      if (pid > 0) ::kill(pid, SIGTERM);
      if (!reap(kStopGraceMs)) {
        LOGW("ENGINE", "%s: mpv ignored SIGTERM, killing", _opts.name.c_str());
        kill();
        if (!reap(kStopGraceMs)) LOGE("ENGINE", "%s: mpv pid %d could not be reaped", _opts.name.c_str(), (int)_pid.load());
      }
    }
  }
  closeIpc();
}

void MpvEngine::kill() {
  pid_t pid = _pid.load();
  if (pid > 0) ::kill(pid, SIGKILL);
}

} // namespace secmon
