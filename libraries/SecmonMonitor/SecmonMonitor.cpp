#include "SecmonMonitor.h"

#include <time.h>

#include <SecmonLog.h>

namespace secmon {

const char *monitorStateStr(MonitorState s) {
  switch (s) {
  case MonitorState::Playing:
    return "PLAYING";
  case MonitorState::Stopped:
    return "STOPPED";
  case MonitorState::Restart:
    return "RESTART";
  }
  return "?";
}

static double wall_seconds() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return (double)ts.tv_sec + (double)ts.tv_nsec / 1e9;
}

Monitor::Monitor(const MonitorConfig &cfg, const SecretSet &secrets, PowerSurface &power)
    : _cfg(cfg), _secrets(secrets), _power(power), _started(std::chrono::steady_clock::now()) {}

bool Monitor::begin() {
  if (_secrets.empty()) LOGE("MON", "no tokens accepted, every command will be rejected");

  Division div;
  if (!RotationScheduler::checkConfig(_cfg.scheduler, div)) return false;
  LOGI("MON", "%d tiles from %zu urls, rotation every %u ticks", div.tileCount, _cfg.scheduler.urls.size(),
       _cfg.scheduler.refreshPeriodTicks);
  return true;
}

void Monitor::monOn() {
  if (_flags.displayPowerOff.exchange(false)) LOGI("MON", "display on requested");
}

void Monitor::monOff() {
  if (!_flags.displayPowerOff.exchange(true)) {
    LOGI("MON", "display off requested");
    _globalStop.set();
  }
}

void Monitor::monRestart() {
  LOGI("MON", "restart requested");
  _flags.restartRequested = true;
  _globalStop.set();
}

void Monitor::noteMotion() { _flags.motionTrigger = true; }

void Monitor::requestExit() {
  _exit.set();
  _globalStop.set();
}

void Monitor::autoOn(void *ctx) { static_cast<Monitor *>(ctx)->monOn(); }

void Monitor::autoOff(void *ctx) { static_cast<Monitor *>(ctx)->monOff(); }

bool Monitor::applyCommand(const std::string &wire) { return applyCommandAt(wire, wall_seconds()); }

bool Monitor::applyCommandAt(const std::string &wire, double now) {
  Command cmd;
  CommandError err = CommandError::None;
  if (!parseCommand(wire, _secrets, now, _cfg.command, cmd, err)) {
    LOGI("MON", "command rejected: %s", commandErrorStr(err));
    return false;
  }

  LOGI("MON", "command accepted: %s", commandKindStr(cmd.kind));
  switch (cmd.kind) {
  case CommandKind::Restart:
    monRestart();
    break;
  case CommandKind::Auto:
    _flags.autoMode = true;
    break;
  case CommandKind::Force:
    _flags.autoMode = false;
    if (cmd.force) {
      monOn();
    } else {
      monOff();
    }
    break;
  case CommandKind::NoOp:
    break;
  }
  return true;
}

void Monitor::step() {
  const MonitorState cur = _state.load();
  if (_logState) LOGD("MON", "state %s", monitorStateStr(cur));

  switch (cur) {
  case MonitorState::Playing:
    // clear before checking: a request racing with this step then still stops the run
    _globalStop.clear();
    if (!_flags.displayPowerOff.load() && !_flags.restartRequested.load() && !_exit.isSet()) {
      _power.forceOn();
      RotationScheduler sched(_cfg.scheduler, _globalStop);
      if (!sched.run()) {
        LOGE("MON", "players could not start");
        _exit.waitFor(_cfg.idleWaitMs);
      }
    }
    break;
  case MonitorState::Stopped:
    if (_lastState == MonitorState::Playing) _power.forceOff();
    break;
  case MonitorState::Restart:
    break;
  }
  if (cur != MonitorState::Playing) _exit.waitFor(_cfg.idleWaitMs);

  _lastState = cur;
  transition();
  _logState = _state.load() != cur;
}

void Monitor::transition() {
  if (_flags.restartRequested.exchange(false)) {
    _state = MonitorState::Restart;
    return;
  }
  switch (_state.load()) {
  case MonitorState::Playing:
    if (_flags.displayPowerOff.load()) _state = MonitorState::Stopped;
    break;
  case MonitorState::Restart:
    _state = MonitorState::Playing;
    break;
  case MonitorState::Stopped:
    if (!_flags.displayPowerOff.load()) _state = MonitorState::Playing;
    break;
  }
}

void Monitor::run() {
  _power.setup();
  monOn();

  while (!_exit.isSet()) step();

  LOGI("MON", "exiting, display on");
  monOn();
  _power.forceOn();
}

MonitorStatus Monitor::status() const {
  MonitorStatus st;
  st.state = _state.load();
  st.autoMode = _flags.autoMode.load();
  st.displayOff = _flags.displayPowerOff.load();
  st.tokens = _secrets.size();
  st.uptimeS = (uint64_t)std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - _started).count();
  return st;
}

} // namespace secmon
