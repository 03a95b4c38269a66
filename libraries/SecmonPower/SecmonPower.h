#ifndef SECMON_POWER_H
#define SECMON_POWER_H

#include <string>

// Xlib's Display. X.h defines None, True and False as macros, so it is not included here.
struct _XDisplay;

namespace secmon {

// Display power control. Calls are idempotent and best effort.
class PowerSurface {
public:
  virtual ~PowerSurface() {}

  // One time preparation: screen saver off, power management on, no timeouts.
  virtual bool setup() = 0;
  virtual bool isSupported() const = 0;
  virtual bool forceOn() = 0;
  virtual bool forceOff() = 0;
};

// X11 DPMS through the Xext extension.
class DpmsPower : public PowerSurface {
public:
  explicit DpmsPower(const std::string &displayName = std::string());
  ~DpmsPower() override;

  DpmsPower(const DpmsPower &) = delete;
  DpmsPower &operator=(const DpmsPower &) = delete;

  bool setup() override;
  bool isSupported() const override { return _supported; }
  bool forceOn() override;
  bool forceOff() override;

private:
  bool forceLevel(unsigned short level, const char *what);

  std::string _displayName;
  _XDisplay *_dpy = nullptr;
  bool _supported = false;
};

// For headless runs: every call is logged and reports unsupported.
class NullPower : public PowerSurface {
public:
  bool setup() override;
  bool isSupported() const override { return false; }
  bool forceOn() override;
  bool forceOff() override;
};

} // namespace secmon

#endif
