#include "SecmonConfig.h"

#include <fstream>
#include <iterator>

#include <ArduinoJson.h>

#include <SecmonLog.h>

namespace secmon {

static bool read_string(JsonObjectConst obj, const char *key, bool required, std::string &out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) {
    if (required) LOGE("CONFIG", "missing \"%s\"", key);
    return !required;
  }
  if (!v.is<const char *>()) {
    LOGE("CONFIG", "\"%s\" must be a string", key);
    return false;
  }
  out = v.as<const char *>();
  return true;
}

static bool read_strings(JsonObjectConst obj, const char *key, std::vector<std::string> &out) {
  JsonVariantConst v = obj[key];
  if (!v.is<JsonArrayConst>()) {
    LOGE("CONFIG", "\"%s\" must be an array of strings", key);
    return false;
  }
  out.clear();
  for (JsonVariantConst item : v.as<JsonArrayConst>()) {
    if (!item.is<const char *>()) {
      LOGE("CONFIG", "\"%s\" must be an array of strings", key);
      return false;
    }
    out.push_back(item.as<const char *>());
  }
  return true;
}

static bool read_number(JsonObjectConst obj, const char *key, double min, double max, double &out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (v.is<bool>() || !v.is<double>()) {
    LOGE("CONFIG", "\"%s\" must be a number", key);
    return false;
  }
  const double d = v.as<double>();
  if (d < min || d > max) {
    LOGE("CONFIG", "\"%s\" out of range [%g, %g]", key, min, max);
    return false;
  }
  out = d;
  return true;
}

template <typename T> static bool read_int(JsonObjectConst obj, const char *key, double min, double max, T &out) {
  double d = (double)out;
  if (!read_number(obj, key, min, max, d)) return false;
  if (d != (double)(long long)d) {
    LOGE("CONFIG", "\"%s\" must be an integer", key);
    return false;
  }
  out = (T)d;
  return true;
}

bool parseConfig(const std::string &json, AppConfig &out) {
  DynamicJsonDocument doc(kConfigJsonCapacity);
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    LOGE("CONFIG", "parse error: %s", err.c_str());
    return false;
  }
  if (!doc.is<JsonObject>()) {
    LOGE("CONFIG", "top level must be an object");
    return false;
  }
  const JsonDocument &cdoc = doc;
  JsonObjectConst obj = cdoc.as<JsonObjectConst>();

  AppConfig cfg;
  bool ok = read_string(obj, "name", true, cfg.name) && read_strings(obj, "urls", cfg.urls) &&
            read_strings(obj, "tokens", cfg.tokens) && read_string(obj, "mqtt_broker", false, cfg.mqttBroker) &&
            read_int(obj, "mqtt_port", 1, 65535, cfg.mqttPort) && read_int(obj, "mqtt_timeout", 1, 65535, cfg.mqttTimeout) &&
            read_string(obj, "mqtt_username", false, cfg.mqttUsername) &&
            read_string(obj, "mqtt_password", false, cfg.mqttPassword) &&
            read_int(obj, "splitter_refresh_rate", 1, 86400, cfg.splitterRefreshRate) &&
            read_int(obj, "division", 0, 16, cfg.division) && read_number(obj, "max_time_delta", 0, 1e9, cfg.maxTimeDelta) &&
            read_int(obj, "auto_timeout", 1, 604800, cfg.autoTimeout) && read_string(obj, "udp_bind", false, cfg.udpBind) &&
            read_int(obj, "udp_port", 0, 65535, cfg.udpPort) && read_int(obj, "play_timeout", 1, 3600, cfg.playTimeout) &&
            read_int(obj, "join_timeout", 1, 3600, cfg.joinTimeout) &&
            read_string(obj, "motion_prefix", false, cfg.motionPrefix) &&
            read_string(obj, "motion_field", false, cfg.motionField) && read_string(obj, "display", false, cfg.display) &&
            read_string(obj, "mpv_path", false, cfg.mpvPath) && read_string(obj, "log_level", false, cfg.logLevel);
  if (!ok) return false;

  if (cfg.name.empty()) {
    LOGE("CONFIG", "\"name\" must not be empty");
    return false;
  }
  if (cfg.urls.empty()) {
    LOGE("CONFIG", "\"urls\" must not be empty");
    return false;
  }
  secmon_log::Level lvl;
  if (!secmon_log::parseLevel(cfg.logLevel.c_str(), lvl)) {
    LOGE("CONFIG", "unknown log_level \"%s\"", cfg.logLevel.c_str());
    return false;
  }

  out = cfg;
  return true;
}

bool loadConfig(const std::string &path, AppConfig &out) {
  std::ifstream in(path.c_str());
  if (!in) {
    LOGE("CONFIG", "cannot open %s", path.c_str());
    return false;
  }
  std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  LOGD("CONFIG", "loaded %s (%zu bytes)", path.c_str(), json.size());
  return parseConfig(json, out);
}

} // namespace secmon
