#ifndef SECMON_SCHEDULER_H
#define SECMON_SCHEDULER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <SecmonEngine.h>
#include <SecmonGrid.h>
#include <SecmonSync.h>

namespace secmon {

struct SchedulerConfig {
  std::vector<std::string> urls;
  int divisionIndex = 1;

  uint32_t refreshPeriodTicks = 300;
  uint32_t tickMs = 1000;
  uint32_t playTimeoutMs = 15000;
  uint32_t joinTimeoutMs = 30000;
  uint32_t pollMs = 1000;
  // Worst case for RenderEngine::stop(); joinTimeoutMs must exceed playTimeoutMs + stopGraceMs.
  uint32_t stopGraceMs = 3 * MpvEngine::kStopGraceMs;

  // name, geometry and url are filled in per worker.
  EngineOptions engine;
  EngineFactory engineFactory = MpvEngine::create;
  void *engineFactoryCtx = nullptr;
};

// Keeps N tiles on screen with 2N worker slots. A rotation starts the standby
// slot and only retires the live one after the newcomer reported ready (or
// failed). An engine dying on its own sets globalStop; one killed after a
// join timeout does not.
class RotationScheduler {
public:
  RotationScheduler(const SchedulerConfig &cfg, Event &globalStop);
  ~RotationScheduler();

  RotationScheduler(const RotationScheduler &) = delete;
  RotationScheduler &operator=(const RotationScheduler &) = delete;

  // Division and url count check without allocating anything.
  static bool checkConfig(const SchedulerConfig &cfg, Division &div);

  bool begin();
  bool start();
  bool rotate();
  void shutdown();

  // begin + start, tick until globalStop, shutdown. False if it could not start.
  bool run();

  int tileCount() const { return _div.tileCount; }
  int slotCount() const { return (int)_slots.size(); }
  int cursor() const { return _cursor; }

  bool slotRunning(int index) const;
  bool slotFailed(int index) const;
  int slotTile(int index) const;
  int slotPredecessor(int index) const;

private:
  struct Slot {
    int index = 0;
    int tile = -1;
    int predecessor = -1;
    std::string url;

    Mailbox mailbox;
    std::thread thread;
    std::unique_ptr<RenderEngine> engine;
    uint32_t launch = 0;
    bool started = false;
    std::atomic<bool> failed{false};
    std::atomic<bool> retiring{false}; // set before a join timeout kill

    mutable std::mutex mu;
    std::condition_variable cv;
    bool done = true;
  };

  bool launch(int index, int tile, int predecessor);
  bool joinSlot(int index, uint32_t timeoutMs);
  void workerMain(Slot *slot);
  void finishWorker(Slot *slot);

  SchedulerConfig _cfg;
  Event &_globalStop;
  Division _div;
  bool _begun = false;
  int _cursor = 0;
  uint32_t _launches = 0;
  std::vector<std::unique_ptr<Slot>> _slots;
};

} // namespace secmon

#endif
