#include "SecmonSync.h"

#include <chrono>

namespace secmon {

const size_t Mailbox::kCapacity;

void Event::set() {
  {
    std::lock_guard<std::mutex> lock(_mu);
    _set = true;
  }
  _cv.notify_all();
}

void Event::clear() {
  std::lock_guard<std::mutex> lock(_mu);
  _set = false;
}

bool Event::isSet() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _set;
}

bool Event::waitFor(uint32_t timeoutMs) const {
  std::unique_lock<std::mutex> lock(_mu);
  return _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return _set; });
}

void Mailbox::post(SlotMsg kind, uint32_t launch) {
  SlotMessage msg;
  msg.kind = kind;
  msg.launch = launch;
  {
    std::lock_guard<std::mutex> lock(_mu);
    // If full, drop the oldest entry.
    if (_q.size() >= kCapacity) _q.pop_front();
    _q.push_back(msg);
  }
  _cv.notify_one();
}

bool Mailbox::waitFor(uint32_t timeoutMs, SlotMessage &out) {
  std::unique_lock<std::mutex> lock(_mu);
  if (!_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return !_q.empty(); })) return false;
  out = _q.front();
  _q.pop_front();
  return true;
}

size_t Mailbox::drain() {
  std::lock_guard<std::mutex> lock(_mu);
  size_t n = _q.size();
  _q.clear();
  return n;
}

size_t Mailbox::pending() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _q.size();
}

} // namespace secmon
