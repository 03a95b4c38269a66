#ifndef SECMON_COMMAND_H
#define SECMON_COMMAND_H

#include <string>

#include <SecmonAuth.h>

namespace secmon {

enum class CommandKind { NoOp, Restart, Auto, Force };

enum class CommandError { None, NotCommand, BadPayload, StaleCommand, AuthFailure };

struct Command {
  CommandKind kind = CommandKind::NoOp;
  bool force = false; // only meaningful for CommandKind::Force
  double sentTime = 0;
};

struct CommandPolicy {
  double maxDeltaSeconds = 7200;
  size_t jsonCapacity = 2048;
};

const char *commandErrorStr(CommandError err);
const char *commandKindStr(CommandKind kind);

// Splits "(<json>, <signature>)". The json part is the longest candidate, so a
// top level "}, " inside the payload moves the split (known limitation).
bool splitEnvelope(const std::string &wire, std::string &json, std::string &signature);

std::string formatEnvelope(const std::string &json, const std::string &signature);

// Freshness is checked before the signature; the signature covers the raw json text.
bool parseCommand(const std::string &wire, const SecretSet &secrets, double now, const CommandPolicy &policy, Command &out,
                  CommandError &err);

} // namespace secmon

#endif
