#ifndef SECMON_MONITOR_H
#define SECMON_MONITOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <SecmonAuth.h>
#include <SecmonCommand.h>
#include <SecmonPower.h>
#include <SecmonScheduler.h>
#include <SecmonSync.h>

namespace secmon {

enum class MonitorState : uint8_t { Playing, Stopped, Restart };

const char *monitorStateStr(MonitorState s);

struct MonitorConfig {
  SchedulerConfig scheduler;
  CommandPolicy command;
  uint32_t idleWaitMs = 1000;
};

struct MonitorStatus {
  MonitorState state = MonitorState::Playing;
  bool autoMode = true;
  bool displayOff = false;
  size_t tokens = 0;
  uint64_t uptimeS = 0;
};

// Top level control loop. PLAYING runs one RotationScheduler until globalStop
// fires; STOPPED keeps the display powered off.
class Monitor {
public:
  Monitor(const MonitorConfig &cfg, const SecretSet &secrets, PowerSurface &power);

  // Validates the scheduler settings. False means run() would never play.
  bool begin();

  void step();
  void run();

  // Safe from any thread.
  void requestExit();
  bool exitRequested() const { return _exit.isSet(); }

  void monOn();
  void monOff();
  void monRestart();

  // Parses, authenticates and applies a wire command. True if it was accepted.
  bool applyCommand(const std::string &wire);
  bool applyCommandAt(const std::string &wire, double now);

  void noteMotion();

  MonitorStatus status() const;
  MonitorState state() const { return _state.load(); }

  ControlFlags &flags() { return _flags; }
  Event &globalStop() { return _globalStop; }

  // AutoAction adapters; ctx is the Monitor.
  static void autoOn(void *ctx);
  static void autoOff(void *ctx);

private:
  void transition();

  MonitorConfig _cfg;
  SecretSet _secrets;
  PowerSurface &_power;

  ControlFlags _flags;
  Event _globalStop;
  Event _exit;

  std::atomic<MonitorState> _state{MonitorState::Playing};
  MonitorState _lastState = MonitorState::Playing;
  bool _logState = true;

  std::chrono::steady_clock::time_point _started;
};

} // namespace secmon

#endif
