#ifndef SECMON_SYNC_H
#define SECMON_SYNC_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace secmon {

// Process wide intents. Writers:
//   autoMode         remote commands
//   motionTrigger    motion events (set) / idle timer (consume)
//   displayPowerOff  monOn/monOff
//   restartRequested remote commands (set) / control loop (consume)
struct ControlFlags {
  std::atomic<bool> autoMode{true};
  std::atomic<bool> motionTrigger{false};
  std::atomic<bool> displayPowerOff{false};
  std::atomic<bool> restartRequested{false};
};

// Level triggered flag with bounded waits. Every wait takes an explicit timeout.
class Event {
public:
  void set();
  void clear();
  bool isSet() const;

  // Returns true if the event is set on return.
  bool waitFor(uint32_t timeoutMs) const;

private:
  mutable std::mutex _mu;
  mutable std::condition_variable _cv;
  bool _set = false;
};

enum class SlotMsg : uint8_t { Ready, Stop };

struct SlotMessage {
  SlotMsg kind = SlotMsg::Stop;
  uint32_t launch = 0; // sender's launch number; 0 when not sent by a worker
};

// Single consumer message channel owned by one worker slot.
class Mailbox {
public:
  static const size_t kCapacity = 8;

  void post(SlotMsg kind, uint32_t launch = 0);
  bool waitFor(uint32_t timeoutMs, SlotMessage &out);
  size_t drain();
  size_t pending() const;

private:
  mutable std::mutex _mu;
  std::condition_variable _cv;
  std::deque<SlotMessage> _q;
};

} // namespace secmon

#endif
