#ifndef SECMON_TEST_FAKES_H
#define SECMON_TEST_FAKES_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <SecmonEngine.h>
#include <SecmonPower.h>

namespace secmon_test {

struct FakeBehavior {
  bool startOk = true;
  secmon::PlayWait play = secmon::PlayWait::Playing;
  uint32_t startDelayMs = 0; // slow spawn, cut short by kill()
  uint32_t playDelayMs = 0;
  bool blockStopUntilKilled = false;
};

struct FakeEngineState {
  std::mutex mu;
  std::condition_variable cv;
  secmon::EngineOptions opts;
  bool configured = false;
  bool alive = false;
  bool stopped = false;
  bool killed = false;
  bool crashed = false;

  std::string geometry() {
    std::lock_guard<std::mutex> lock(mu);
    return opts.geometry;
  }
  bool isStopped() {
    std::lock_guard<std::mutex> lock(mu);
    return stopped;
  }
  bool isKilled() {
    std::lock_guard<std::mutex> lock(mu);
    return killed;
  }
  void crash() {
    std::lock_guard<std::mutex> lock(mu);
    crashed = true;
    alive = false;
  }
};

class FakeEngine : public secmon::RenderEngine {
public:
  FakeEngine(const FakeBehavior &b, std::shared_ptr<FakeEngineState> st) : _b(b), _st(st) {}

  bool configure(const secmon::EngineOptions &opts) override {
    std::lock_guard<std::mutex> lock(_st->mu);
    _st->opts = opts;
    _st->configured = true;
    return true;
  }

  bool start() override {
    std::unique_lock<std::mutex> lock(_st->mu);
    if (_b.startDelayMs) {
      _st->cv.wait_for(lock, std::chrono::milliseconds(_b.startDelayMs), [this] { return _st->killed; });
    }
    if (!_b.startOk) return false;
    _st->alive = !_st->crashed;
    return true;
  }

  secmon::PlayWait waitUntilPlaying(uint32_t timeoutMs) override {
    std::unique_lock<std::mutex> lock(_st->mu);
    uint32_t delay = _b.playDelayMs < timeoutMs ? _b.playDelayMs : timeoutMs;
    _st->cv.wait_for(lock, std::chrono::milliseconds(delay), [this] { return _st->killed; });
    if (_st->killed) return secmon::PlayWait::Error;
    return _b.play;
  }

  bool isAlive() override {
    std::lock_guard<std::mutex> lock(_st->mu);
    return _st->alive && !_st->killed;
  }

  void stop() override {
    std::unique_lock<std::mutex> lock(_st->mu);
    if (_b.blockStopUntilKilled) {
      // stuck engine: only kill() gets it out (capped so a broken test cannot hang)
      _st->cv.wait_for(lock, std::chrono::seconds(10), [this] { return _st->killed; });
    }
    _st->alive = false;
    _st->stopped = true;
  }

  void kill() override {
    {
      std::lock_guard<std::mutex> lock(_st->mu);
      _st->killed = true;
      _st->alive = false;
    }
    _st->cv.notify_all();
  }

private:
  FakeBehavior _b;
  std::shared_ptr<FakeEngineState> _st;
};

// Engine factory for RotationScheduler: ctx is the plant. Behaviors are taken
// from the script in creation order, then the default.
class FakePlant {
public:
  FakeBehavior defaults;

  void script(const FakeBehavior &b) {
    std::lock_guard<std::mutex> lock(_mu);
    _script.push_back(b);
  }

  size_t created() {
    std::lock_guard<std::mutex> lock(_mu);
    return _engines.size();
  }

  std::shared_ptr<FakeEngineState> engine(size_t i) {
    std::lock_guard<std::mutex> lock(_mu);
    return i < _engines.size() ? _engines[i] : nullptr;
  }

  static std::unique_ptr<secmon::RenderEngine> create(void *ctx) {
    FakePlant *self = static_cast<FakePlant *>(ctx);
    std::lock_guard<std::mutex> lock(self->_mu);
    FakeBehavior b = self->defaults;
    if (!self->_script.empty()) {
      b = self->_script.front();
      self->_script.pop_front();
    }
    std::shared_ptr<FakeEngineState> st(new FakeEngineState());
    self->_engines.push_back(st);
    return std::unique_ptr<secmon::RenderEngine>(new FakeEngine(b, st));
  }

private:
  std::mutex _mu;
  std::deque<FakeBehavior> _script;
  std::vector<std::shared_ptr<FakeEngineState>> _engines;
};

class FakePower : public secmon::PowerSurface {
public:
  bool setup() override {
    std::lock_guard<std::mutex> lock(_mu);
    _setups++;
    return true;
  }
  bool isSupported() const override { return true; }
  bool forceOn() override {
    std::lock_guard<std::mutex> lock(_mu);
    _log.push_back("on");
    return true;
  }
  bool forceOff() override {
    std::lock_guard<std::mutex> lock(_mu);
    _log.push_back("off");
    return true;
  }

  std::vector<std::string> log() {
    std::lock_guard<std::mutex> lock(_mu);
    return _log;
  }
  int setups() {
    std::lock_guard<std::mutex> lock(_mu);
    return _setups;
  }

private:
  std::mutex _mu;
  std::vector<std::string> _log;
  int _setups = 0;
};

// Polls pred every few ms until it holds or timeoutMs passes.
template <typename Pred> bool waitUntil(Pred pred, uint32_t timeoutMs = 3000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace secmon_test

#endif
