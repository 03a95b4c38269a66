#include "SecmonAutoTimer.h"

#include <SecmonLog.h>

namespace secmon {

AutoTimer::AutoTimer(ControlFlags &flags, const AutoTimerConfig &cfg)
    : _flags(flags), _cfg(cfg), _lastAuto(flags.autoMode.load()) {}

AutoTimer::~AutoTimer() { stop(); }

void AutoTimer::setActions(AutoAction on, AutoAction off, void *ctx) {
  _on = on;
  _off = off;
  _ctx = ctx;
}

void AutoTimer::fire(AutoAction action) {
  if (action) action(_ctx);
}

void AutoTimer::tick() {
  const bool motion = _flags.motionTrigger.exchange(false);
  const bool autoOn = _flags.autoMode.load();

  if (autoOn) {
    if (!_lastAuto) {
      LOGD("AUTO", "automatic control resumed");
      _counter = 0;
      fire(_on);
    } else if (motion) {
      _counter = 0;
      fire(_on);
    }
  }
  _lastAuto = autoOn;

  if (_counter < _cfg.timeoutTicks) {
    _counter++;
    if (_counter == _cfg.timeoutTicks && autoOn) {
      LOGI("AUTO", "no motion for %u ticks, display off", _cfg.timeoutTicks);
      fire(_off);
    }
  }
}

bool AutoTimer::start() {
  if (_thread.joinable()) return false;
  _stop.clear();
  _thread = std::thread([this] {
    LOGD("AUTO", "automatic control start");
    while (!_stop.waitFor(_cfg.tickMs)) tick();
    LOGD("AUTO", "automatic control stop");
  });
  return true;
}

void AutoTimer::stop() {
  _stop.set();
  if (_thread.joinable()) _thread.join();
}

} // namespace secmon
