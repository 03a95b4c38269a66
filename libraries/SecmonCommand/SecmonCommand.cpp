#include "SecmonCommand.h"

#include <cmath>

#include <ArduinoJson.h>

#include <SecmonLog.h>

namespace secmon {

const char *commandErrorStr(CommandError err) {
  switch (err) {
  case CommandError::None:
    return "NONE";
  case CommandError::NotCommand:
    return "NOT_COMMAND";
  case CommandError::BadPayload:
    return "BAD_PAYLOAD";
  case CommandError::StaleCommand:
    return "STALE_COMMAND";
  case CommandError::AuthFailure:
    return "AUTH_FAILURE";
  }
  return "UNKNOWN";
}

const char *commandKindStr(CommandKind kind) {
  switch (kind) {
  case CommandKind::NoOp:
    return "noop";
  case CommandKind::Restart:
    return "restart";
  case CommandKind::Auto:
    return "auto";
  case CommandKind::Force:
    return "force";
  }
  return "?";
}

bool splitEnvelope(const std::string &wire, std::string &json, std::string &signature) {
  const size_t n = wire.size();
  // shortest match is "({x}, s)"
  if (n < 8 || wire[0] != '(' || wire[n - 1] != ')') return false;
  if (wire.find('\n') != std::string::npos) return false;

  // the signature needs at least one character, so "}, " starts at n - 5 at the latest
  size_t p = wire.rfind("}, ", n - 5);
  if (p == std::string::npos || p < 3) return false;
  if (wire[1] != '{') return false;

  json = wire.substr(1, p);
  signature = wire.substr(p + 3, n - p - 4);
  return true;
}

std::string formatEnvelope(const std::string &json, const std::string &signature) {
  return "(" + json + ", " + signature + ")";
}

static bool truthy(JsonVariantConst v) {
  if (v.isNull()) return false;
  if (v.is<bool>()) return v.as<bool>();
  if (v.is<double>()) return v.as<double>() != 0;
  if (v.is<const char *>()) return (v.as<const char *>())[0] != '\0';
  if (v.is<JsonArrayConst>()) return v.size() > 0;
  if (v.is<JsonObjectConst>()) return v.size() > 0;
  return false;
}

static bool is_true(JsonVariantConst v) {
  if (v.is<bool>()) return v.as<bool>();
  if (v.is<double>()) return v.as<double>() == 1;
  return false;
}

bool parseCommand(const std::string &wire, const SecretSet &secrets, double now, const CommandPolicy &policy, Command &out,
                  CommandError &err) {
  std::string json;
  std::string signature;
  if (!splitEnvelope(wire, json, signature)) {
    err = CommandError::NotCommand;
    return false;
  }
  LOGD("CMD", "split strings are: %s and %s", json.c_str(), signature.c_str());

  DynamicJsonDocument doc(policy.jsonCapacity);
  DeserializationError derr = deserializeJson(doc, json);
  if (derr) {
    LOGI("CMD", "payload rejected: %s", derr.c_str());
    err = CommandError::BadPayload;
    return false;
  }
  if (!doc.is<JsonObject>()) {
    err = CommandError::BadPayload;
    return false;
  }
  const JsonDocument &cdoc = doc;

  JsonVariantConst t = cdoc["time"];
  if (t.is<bool>() || !t.is<double>()) {
    LOGI("CMD", "payload rejected: no numeric time");
    err = CommandError::BadPayload;
    return false;
  }
  const double sent = t.as<double>();
  const double diff = now - sent;
  LOGD("CMD", "current time: %.3f, sent time: %.3f, diff: %.3f", now, sent, diff);
  if (!(std::fabs(diff) <= policy.maxDeltaSeconds)) {
    err = CommandError::StaleCommand;
    return false;
  }

  if (!verify(json, signature, secrets)) {
    err = CommandError::AuthFailure;
    return false;
  }

  Command cmd;
  cmd.sentTime = sent;
  if (doc.containsKey("restart")) {
    cmd.kind = truthy(cdoc["restart"]) ? CommandKind::Restart : CommandKind::NoOp;
  } else if (doc.containsKey("auto") && is_true(cdoc["auto"])) {
    cmd.kind = CommandKind::Auto;
  } else if (doc.containsKey("force")) {
    cmd.kind = CommandKind::Force;
    cmd.force = truthy(cdoc["force"]);
  }

  out = cmd;
  err = CommandError::None;
  return true;
}

} // namespace secmon
