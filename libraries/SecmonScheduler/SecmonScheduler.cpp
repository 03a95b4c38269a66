#include "SecmonScheduler.h"

#include <chrono>

#include <SecmonLog.h>

namespace secmon {

RotationScheduler::RotationScheduler(const SchedulerConfig &cfg, Event &globalStop) : _cfg(cfg), _globalStop(globalStop) {}

RotationScheduler::~RotationScheduler() { shutdown(); }

bool RotationScheduler::checkConfig(const SchedulerConfig &cfg, Division &div) {
  if (!computeDivision(cfg.divisionIndex, div)) return false;
  if ((int)cfg.urls.size() < div.tileCount) {
    LOGE("SCHED", "INVALID_ARGUMENT: division %d needs %d urls, got %zu", cfg.divisionIndex, div.tileCount, cfg.urls.size());
    return false;
  }
  if ((uint64_t)cfg.joinTimeoutMs <= (uint64_t)cfg.playTimeoutMs + cfg.stopGraceMs) {
    LOGE("SCHED", "INVALID_ARGUMENT: join timeout %u ms must exceed play timeout %u ms plus stop grace %u ms",
         cfg.joinTimeoutMs, cfg.playTimeoutMs, cfg.stopGraceMs);
    return false;
  }
  if (!cfg.engineFactory) {
    LOGE("SCHED", "INVALID_ARGUMENT: no engine factory");
    return false;
  }
  return true;
}

bool RotationScheduler::begin() {
  if (_begun) return true;
  if (!checkConfig(_cfg, _div)) return false;

  _slots.clear();
  for (int i = 0; i < 2 * _div.tileCount; i++) {
    std::unique_ptr<Slot> slot(new Slot());
    slot->index = i;
    _slots.push_back(std::move(slot));
  }
  _cursor = 0;
  _begun = true;
  LOGI("SCHED", "%dx%d grid, %d tiles, %d slots", _div.columns, _div.rows, _div.tileCount, slotCount());
  return true;
}

bool RotationScheduler::start() {
  if (!_begun) return false;
  const int n = _div.tileCount;
  for (int i = 0; i < n; i++) {
    // nobody reads the standby mailboxes yet; rotate() drains them before reuse
    if (!launch(i, i, i + n)) return false;
  }
  return true;
}

bool RotationScheduler::launch(int index, int tile, int predecessor) {
  Slot &s = *_slots[index];
  if (s.started) joinSlot(index, _cfg.joinTimeoutMs);

  s.engine = _cfg.engineFactory(_cfg.engineFactoryCtx);
  if (!s.engine) {
    LOGE("SCHED", "player %d: engine factory returned nothing", index);
    return false;
  }
  s.tile = tile;
  s.url = _cfg.urls[tile % _div.tileCount];
  s.predecessor = predecessor;
  s.launch = ++_launches;
  s.failed = false;
  s.retiring = false;
  {
    std::lock_guard<std::mutex> lock(s.mu);
    s.done = false;
  }
  s.thread = std::thread(&RotationScheduler::workerMain, this, &s);
  s.started = true;
  LOGD("SCHED", "player %d started for tile %d, predecessor %d", index, tile, predecessor);
  return true;
}

void RotationScheduler::workerMain(Slot *slot) {
  RenderEngine &engine = *slot->engine;

  EngineOptions opts = _cfg.engine;
  opts.name = "player " + std::to_string(slot->index);
  opts.url = slot->url;
  Geometry geo;
  bool ok = tileGeometry(_div, slot->tile, geo);
  if (ok) {
    opts.geometry = geo.str();
    ok = engine.configure(opts) && engine.start();
    if (!ok) LOGE("SCHED", "%s: engine did not start", opts.name.c_str());
  }
  if (ok) {
    PlayWait w = engine.waitUntilPlaying(_cfg.playTimeoutMs);
    if (w != PlayWait::Playing) {
      LOGW("SCHED", "%s: %s while waiting for %s", opts.name.c_str(), playWaitStr(w), opts.url.c_str());
      ok = false;
    }
  }
  if (!ok) {
    engine.stop();
    slot->failed = true;
  } else {
    LOGI("SCHED", "%s: playing tile %d (%s)", opts.name.c_str(), slot->tile, geo.str().c_str());
  }

  // ready or failed, the predecessor may go now
  if (slot->predecessor >= 0 && slot->predecessor < slotCount())
    _slots[slot->predecessor]->mailbox.post(SlotMsg::Ready, slot->launch);

  for (;;) {
    SlotMessage msg;
    if (slot->mailbox.waitFor(_cfg.pollMs, msg)) {
      // only a worker launched after this one can replace it
      if (msg.kind == SlotMsg::Ready && msg.launch <= slot->launch) {
        LOGD("SCHED", "%s: stale ready from launch %u ignored", opts.name.c_str(), msg.launch);
        continue;
      }
      LOGD("SCHED", "%s: %s received, exiting", opts.name.c_str(), msg.kind == SlotMsg::Ready ? "ready" : "stop");
      break;
    }
    if (_globalStop.isSet() || slot->retiring) break;
    if (!slot->failed && !engine.isAlive()) {
      // joinSlot sets retiring before kill()
      if (slot->retiring) break;
      LOGE("SCHED", "%s: engine died, stopping all players", opts.name.c_str());
      _globalStop.set();
      break;
    }
  }

  finishWorker(slot);
}

void RotationScheduler::finishWorker(Slot *slot) {
  slot->engine->stop();
  {
    std::lock_guard<std::mutex> lock(slot->mu);
    slot->done = true;
  }
  slot->cv.notify_all();
}

bool RotationScheduler::joinSlot(int index, uint32_t timeoutMs) {
  Slot &s = *_slots[index];
  if (!s.started) return true;

  bool clean;
  {
    std::unique_lock<std::mutex> lock(s.mu);
    clean = s.cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&s] { return s.done; });
  }
  if (!clean) {
    LOGW("SCHED", "JOIN_TIMEOUT: player %d still running after %u ms, killing", index, timeoutMs);
    s.retiring = true;
    s.engine->kill();
  }
  // once killed, every engine call in the worker returns within its own bound
  s.thread.join();
  s.engine.reset();
  s.started = false;
  return clean;
}

bool RotationScheduler::rotate() {
  if (!_begun) return false;
  const int n = _div.tileCount;
  const int p = _cursor;
  const int next = (p + n) % (2 * n);

  size_t stale = _slots[next]->mailbox.drain();
  if (stale) LOGD("SCHED", "player %d: dropped %zu stale messages", next, stale);

  LOGI("SCHED", "rotating tile %d: player %d -> %d", p % n, p, next);
  if (!launch(next, p % n, p)) return false;
  joinSlot(p, _cfg.joinTimeoutMs);

  _cursor = (p + 1) % (2 * n);
  return true;
}

void RotationScheduler::shutdown() {
  if (!_begun) return;
  for (size_t i = 0; i < _slots.size(); i++) _slots[i]->mailbox.post(SlotMsg::Stop);
  for (size_t i = 0; i < _slots.size(); i++) joinSlot((int)i, _cfg.joinTimeoutMs);
}

bool RotationScheduler::run() {
  if (!begin()) return false;
  if (!start()) {
    shutdown();
    return false;
  }

  uint32_t ticks = 0;
  while (!_globalStop.waitFor(_cfg.tickMs)) {
    if (++ticks < _cfg.refreshPeriodTicks) continue;
    ticks = 0;
    if (!rotate()) {
      LOGE("SCHED", "rotation failed, stopping");
      _globalStop.set();
    }
  }

  LOGI("SCHED", "stop requested, shutting down players");
  shutdown();
  return true;
}

bool RotationScheduler::slotRunning(int index) const {
  if (index < 0 || index >= slotCount()) return false;
  const Slot &s = *_slots[index];
  if (!s.started) return false;
  std::lock_guard<std::mutex> lock(s.mu);
  return !s.done;
}

bool RotationScheduler::slotFailed(int index) const {
  if (index < 0 || index >= slotCount()) return false;
  return _slots[index]->failed;
}

int RotationScheduler::slotTile(int index) const {
  if (index < 0 || index >= slotCount()) return -1;
  return _slots[index]->tile;
}

int RotationScheduler::slotPredecessor(int index) const {
  if (index < 0 || index >= slotCount()) return -1;
  return _slots[index]->predecessor;
}

} // namespace secmon
