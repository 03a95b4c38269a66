#ifndef SECMON_AUTO_TIMER_H
#define SECMON_AUTO_TIMER_H

#include <cstdint>
#include <thread>

#include <SecmonSync.h>

namespace secmon {

struct AutoTimerConfig {
  uint32_t timeoutTicks = 900;
  uint32_t tickMs = 1000;
};

using AutoAction = void (*)(void *ctx);

// Turns the display off after timeoutTicks without motion while autoMode is set.
class AutoTimer {
public:
  AutoTimer(ControlFlags &flags, const AutoTimerConfig &cfg);
  ~AutoTimer();

  void setActions(AutoAction on, AutoAction off, void *ctx = nullptr);

  // One step of the timer; start() calls it every tickMs.
  void tick();

  bool start();
  void stop();

  uint32_t counter() const { return _counter; }

private:
  void fire(AutoAction action);

  ControlFlags &_flags;
  AutoTimerConfig _cfg;
  AutoAction _on = nullptr;
  AutoAction _off = nullptr;
  void *_ctx = nullptr;

  uint32_t _counter = 0;
  bool _lastAuto;

  Event _stop;
  std::thread _thread;
};

} // namespace secmon

#endif
