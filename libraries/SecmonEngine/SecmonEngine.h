#ifndef SECMON_ENGINE_H
#define SECMON_ENGINE_H

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace secmon {

// Tuning options are passed through to the engine untouched.
struct EngineOptions {
  std::string name;     // for log lines, e.g. "player 3"
  std::string geometry; // see Geometry::str()
  std::string url;

  uint32_t networkTimeoutS = 10;
  std::string profile = "low-latency";
  std::string audioOutput = "pulse";

  std::string mpvPath = "mpv";
  std::string ipcDir = "/tmp";
};

enum class PlayWait { Playing, Timeout, Error };

const char *playWaitStr(PlayWait w);

// Handle to one rendering engine instance. Owned and driven by a single worker;
// kill() is the only call made from another thread.
class RenderEngine {
public:
  virtual ~RenderEngine() {}

  virtual bool configure(const EngineOptions &opts) = 0;
  virtual bool start() = 0;
  virtual PlayWait waitUntilPlaying(uint32_t timeoutMs) = 0;
  virtual bool isAlive() = 0;
  virtual void stop() = 0;
  virtual void kill() = 0;
};

using EngineFactory = std::unique_ptr<RenderEngine> (*)(void *ctx);

// Runs mpv as a child process and talks to it over its JSON IPC socket.
class MpvEngine : public RenderEngine {
public:
  static const uint32_t kStopGraceMs = 2000;
  static const uint32_t kIpcPollMs = 100;

  MpvEngine() {}
  ~MpvEngine() override;

  bool configure(const EngineOptions &opts) override;
  bool start() override;
  PlayWait waitUntilPlaying(uint32_t timeoutMs) override;
  bool isAlive() override;
  void stop() override;
  void kill() override;

  static std::unique_ptr<RenderEngine> create(void *ctx);

private:
  bool connectIpc();
  bool sendIpc(const char *line);
  // Returns 1 with a line, 0 on timeout, -1 when the socket closed.
  int readIpcLine(std::string &line, uint32_t timeoutMs);
  bool reap(uint32_t timeoutMs);
  void closeIpc();

  EngineOptions _opts;
  bool _configured = false;
  std::atomic<pid_t> _pid{-1};
  int _ipc = -1;
  std::string _sockPath;
  std::string _rx;
};

} // namespace secmon

#endif
