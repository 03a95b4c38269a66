#include "SecmonPower.h"

#include <X11/Xlib.h>
#include <X11/extensions/dpms.h>

#include <SecmonLog.h>

namespace secmon {

DpmsPower::DpmsPower(const std::string &displayName) : _displayName(displayName) {}

DpmsPower::~DpmsPower() {
  if (_dpy) XCloseDisplay(_dpy);
}

bool DpmsPower::setup() {
  if (!_dpy) {
    _dpy = XOpenDisplay(_displayName.empty() ? nullptr : _displayName.c_str());
    if (!_dpy) {
      LOGW("POWER", "cannot open display %s, power control disabled", _displayName.empty() ? "$DISPLAY" : _displayName.c_str());
      _supported = false;
      return false;
    }
  }

  int event_base = 0;
  int error_base = 0;
  if (!DPMSQueryExtension(_dpy, &event_base, &error_base) || !DPMSCapable(_dpy)) {
    LOGW("POWER", "display has no DPMS support, power control disabled");
    _supported = false;
    return false;
  }

  XSetScreenSaver(_dpy, 0, 0, PreferBlanking, AllowExposures);
  DPMSEnable(_dpy);
  DPMSSetTimeouts(_dpy, 0, 0, 0);
  XSync(_dpy, False);

  _supported = true;
  LOGI("POWER", "DPMS enabled, screen saver and timeouts disabled");
  return true;
}

bool DpmsPower::forceLevel(unsigned short level, const char *what) {
  if (!_supported) {
    LOGD("POWER", "display %s skipped, not supported", what);
    return false;
  }
  DPMSForceLevel(_dpy, level);
  XSync(_dpy, False);
  LOGI("POWER", "display %s", what);
  return true;
}

bool DpmsPower::forceOn() { return forceLevel(DPMSModeOn, "on"); }

bool DpmsPower::forceOff() { return forceLevel(DPMSModeOff, "off"); }

bool NullPower::setup() {
  LOGW("POWER", "no power control, display stays as is");
  return false;
}

bool NullPower::forceOn() {
  LOGD("POWER", "display on (not supported)");
  return false;
}

bool NullPower::forceOff() {
  LOGD("POWER", "display off (not supported)");
  return false;
}

} // namespace secmon
