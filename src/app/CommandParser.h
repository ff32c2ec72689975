#pragma once

#include <stdint.h>

#include <string>

enum class CommandKind : uint8_t {
  none,
  sensor,
  trigger,
  resolve,
  recovery,
  panic,
  panic_off,
  lockdown_on,
  lockdown_off,
  power_fail,
  power_restored,
  wellbeing,
  route_set,
  route_best,
  config_set,
  status,
  help
};

static const char* toString(CommandKind k) {
  switch (k) {
    case CommandKind::none:           return "none";
    case CommandKind::sensor:         return "sensor";
    case CommandKind::trigger:        return "trigger";
    case CommandKind::resolve:        return "resolve";
    case CommandKind::recovery:       return "recovery";
    case CommandKind::panic:          return "panic";
    case CommandKind::panic_off:      return "panic off";
    case CommandKind::lockdown_on:    return "lockdown on";
    case CommandKind::lockdown_off:   return "lockdown off";
    case CommandKind::power_fail:     return "power fail";
    case CommandKind::power_restored: return "power restored";
    case CommandKind::wellbeing:      return "wellbeing";
    case CommandKind::route_set:      return "route";
    case CommandKind::route_best:     return "route best";
    case CommandKind::config_set:     return "config";
    case CommandKind::status:         return "status";
    case CommandKind::help:           return "help";
    default:                          return "unknown";
  }
}

// Keywords and ids are lowercased; text keeps the caller's case.
struct Command {
  CommandKind kind = CommandKind::none;
  std::string id;
  std::string arg;
  std::string text;
  bool cleared = false;
  uint16_t step = 0;
  uint32_t value = 0;
};

enum class AuthResult : uint8_t {
  ok,
  token_required,
  unauthorized
};

static const char* toString(AuthResult r) {
  switch (r) {
    case AuthResult::ok:             return "ok";
    case AuthResult::token_required: return "token required";
    case AuthResult::unauthorized:   return "unauthorized";
    default:                         return "unknown";
  }
}

namespace CommandParser {

std::string trim(const std::string& s);
std::string normalize(const std::string& s);
bool parseUint32Strict(const std::string& s, uint32_t& out);

// Strips "token|" from a remote payload. With no configured token only
// "status" passes unless allowWithoutToken is set.
AuthResult authorize(const std::string& payload,
                     const std::string& configuredToken,
                     bool allowWithoutToken,
                     std::string& outLine);

// false with a short reason in outError when the line does not match the grammar.
bool parse(const std::string& line, Command& out, std::string& outError);

const char* helpText();

} // namespace CommandParser
