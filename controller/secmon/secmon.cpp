// secmon: security monitor video wall
// Rotating mpv tiles, display power through DPMS, signed remote commands over MQTT and UDP.

#include <signal.h>
#include <time.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

#include <SecmonAuth.h>
#include <SecmonAutoTimer.h>
#include <SecmonConfig.h>
#include <SecmonLog.h>
#include <SecmonMonitor.h>
#include <SecmonMqtt.h>
#include <SecmonPower.h>
#include <SecmonRemote.h>
#include <SecmonUdp.h>

using namespace secmon;

static const char *CONFIG_FILE = "mon_config.json";

static void usage(const char *argv0) { fprintf(stderr, "usage: %s [-c config.json] [-v]\n", argv0); }

static std::string default_config_path() {
  char exe[4096];
  ssize_t n = readlink("/proc/self/exe", exe, sizeof(exe) - 1);
  if (n <= 0) return CONFIG_FILE;
  exe[n] = '\0';
  std::string dir(exe);
  size_t slash = dir.rfind('/');
  if (slash == std::string::npos) return CONFIG_FILE;
  return dir.substr(0, slash + 1) + CONFIG_FILE;
}

static MonitorConfig monitor_config(const AppConfig &app) {
  MonitorConfig mc;
  mc.scheduler.urls = app.urls;
  mc.scheduler.divisionIndex = app.division;
  mc.scheduler.refreshPeriodTicks = app.splitterRefreshRate;
  mc.scheduler.playTimeoutMs = app.playTimeout * 1000;
  mc.scheduler.joinTimeoutMs = app.joinTimeout * 1000;
  mc.scheduler.engine.mpvPath = app.mpvPath;
  mc.scheduler.engineFactory = MpvEngine::create;
  mc.command.maxDeltaSeconds = app.maxTimeDelta;
  return mc;
}

static secmon_mqtt::Config mqtt_config(const AppConfig &app) {
  secmon_mqtt::Config c;
  c.brokerHost = app.mqttBroker;
  c.brokerPort = app.mqttPort;
  c.username = app.mqttUsername;
  c.password = app.mqttPassword;
  c.clientId = app.name;
  c.keepAliveSeconds = app.mqttTimeout;
  c.reconnectDelayMs = 5000;
  return c;
}

struct SignalWaiter {
  sigset_t set;
  Monitor *monitor = nullptr;
  Event done;
};

// SIGINT/SIGTERM stay blocked in every thread; this one picks them up.
static void wait_for_signal(SignalWaiter *w) {
  struct timespec tick;
  tick.tv_sec = 1;
  tick.tv_nsec = 0;
  while (!w->done.isSet()) {
    int sig = sigtimedwait(&w->set, nullptr, &tick);
    if (sig < 0) continue;
    LOGW("MAIN", "caught signal %d (%s), exiting", sig, strsignal(sig));
    w->monitor->requestExit();
    break;
  }
}

int main(int argc, char **argv) {
  std::string configPath;
  bool verbose = false;
  int opt;
  while ((opt = getopt(argc, argv, "c:vh")) != -1) {
    switch (opt) {
    case 'c':
      configPath = optarg;
      break;
    case 'v':
      verbose = true;
      break;
    default:
      usage(argv[0]);
      return opt == 'h' ? 0 : 1;
    }
  }
  if (configPath.empty()) configPath = default_config_path();

  LOGI("MAIN", "starting security monitor");

  AppConfig app;
  if (!loadConfig(configPath, app)) {
    LOGE("MAIN", "bad configuration in %s", configPath.c_str());
    return 1;
  }
  secmon_log::Level lvl = secmon_log::DEBUG_L;
  if (!verbose) secmon_log::parseLevel(app.logLevel.c_str(), lvl);
  secmon_log::setLevel(lvl);

  LOGI("MAIN", "decoding %zu tokens", app.tokens.size());
  const SecretSet secrets = decodeTokens(app.tokens);

  SignalWaiter waiter;
  sigemptyset(&waiter.set);
  sigaddset(&waiter.set, SIGINT);
  sigaddset(&waiter.set, SIGTERM);
  // before any thread exists, so all of them inherit the mask
  pthread_sigmask(SIG_BLOCK, &waiter.set, nullptr);

  DpmsPower power(app.display);
  Monitor monitor(monitor_config(app), secrets, power);
  if (!monitor.begin()) return 1;

  RemoteConfig rc;
  rc.name = app.name;
  rc.motionPrefix = app.motionPrefix;
  rc.motionField = app.motionField;
  Remote remote(rc, monitor);

  waiter.monitor = &monitor;
  std::thread signals(wait_for_signal, &waiter);

  secmon_mqtt::Client mqtt(mqtt_config(app));
  bool mqttUp = false;
  if (app.mqttBroker.empty()) {
    LOGW("MAIN", "no mqtt_broker configured, MQTT disabled");
  } else if (mqtt.begin()) {
    for (const std::string &topic : remote.topics()) mqtt.addSubscription(topic);
    mqtt.setMessageHandler(Remote::mqttThunk, &remote);
    mqttUp = mqtt.start();
  }

  secmon_udp::Config uc;
  uc.bindAddress = app.udpBind;
  uc.port = app.udpPort;
  secmon_udp::Listener udp(uc);
  bool udpUp = false;
  if (udp.begin()) {
    udp.setHandler(Remote::udpThunk, &remote);
    udpUp = udp.start();
  } else {
    LOGW("MAIN", "UDP commands disabled");
  }

  AutoTimerConfig ac;
  ac.timeoutTicks = app.autoTimeout;
  AutoTimer autoTimer(monitor.flags(), ac);
  autoTimer.setActions(Monitor::autoOn, Monitor::autoOff, &monitor);
  autoTimer.start();

  monitor.run();

  LOGI("MAIN", "stopping automatic control");
  autoTimer.stop();
  if (udpUp) {
    LOGI("MAIN", "stopping UDP");
    udp.stop();
  }
  if (mqttUp) {
    LOGI("MAIN", "stopping MQTT");
    mqtt.stop();
  }

  waiter.done.set();
  signals.join();
  LOGI("MAIN", "bye");
  return 0;
}
