#include "app/CommandParser.h"

#include <ctype.h>

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string lower(std::string s) {
  for (size_t i = 0; i < s.size(); ++i) {
    s[i] = (char)tolower((unsigned char)s[i]);
  }
  return s;
}

// Next whitespace separated word, lowercased. Empty at end of line.
std::string nextWord(const std::string& line, size_t& pos) {
  while (pos < line.size() && isSpace(line[pos])) ++pos;
  const size_t start = pos;
  while (pos < line.size() && !isSpace(line[pos])) ++pos;
  return lower(line.substr(start, pos - start));
}

std::string rest(const std::string& line, size_t pos) {
  if (pos >= line.size()) return std::string();
  return CommandParser::trim(line.substr(pos));
}

bool fail(std::string& outError, const char* why) {
  outError = why;
  return false;
}

} // namespace

namespace CommandParser {

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isSpace(s[b])) ++b;
  while (e > b && isSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string normalize(const std::string& s) {
  return lower(trim(s));
}

bool parseUint32Strict(const std::string& s, uint32_t& out) {
  if (s.empty()) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = (v * 10u) + (uint64_t)(c - '0');
    if (v > 0xFFFFFFFFull) return false;
  }
  out = (uint32_t)v;
  return true;
}

AuthResult authorize(const std::string& payload,
                     const std::string& configuredToken,
                     bool allowWithoutToken,
                     std::string& outLine) {
  outLine.clear();
  const std::string token = normalize(configuredToken);

  if (token.empty()) {
    const std::string line = trim(payload);
    if (!allowWithoutToken && normalize(line) != "status") return AuthResult::token_required;
    if (line.empty()) return AuthResult::unauthorized;
    outLine = line;
    return AuthResult::ok;
  }

  const size_t sep = payload.find('|');
  if (sep == std::string::npos || sep == 0) return AuthResult::unauthorized;
  if (normalize(payload.substr(0, sep)) != token) return AuthResult::unauthorized;

  const std::string line = trim(payload.substr(sep + 1));
  if (line.empty()) return AuthResult::unauthorized;
  outLine = line;
  return AuthResult::ok;
}

bool parse(const std::string& line, Command& out, std::string& outError) {
  out = Command{};
  outError.clear();

  size_t pos = 0;
  const std::string verb = nextWord(line, pos);
  if (verb.empty()) return fail(outError, "empty command");

  if (verb == "status") {
    out.kind = CommandKind::status;
    return true;
  }

  if (verb == "help" || verb == "?") {
    out.kind = CommandKind::help;
    return true;
  }

  if (verb == "sensor") {
    out.id = nextWord(line, pos);
    out.arg = nextWord(line, pos);
    if (out.id.empty() || out.arg.empty()) return fail(outError, "usage: sensor <id> <event> [payload]");
    out.text = rest(line, pos);
    out.kind = CommandKind::sensor;
    return true;
  }

  if (verb == "trigger") {
    out.id = nextWord(line, pos);
    if (out.id.empty()) return fail(outError, "usage: trigger <type> [reason]");
    out.text = rest(line, pos);
    out.kind = CommandKind::trigger;
    return true;
  }

  if (verb == "resolve") {
    out.id = nextWord(line, pos);
    if (out.id.empty()) return fail(outError, "usage: resolve <incident> [resolution]");
    out.text = rest(line, pos);
    out.kind = CommandKind::resolve;
    return true;
  }

  if (verb == "recovery") {
    out.id = nextWord(line, pos);
    const std::string stepText = nextWord(line, pos);
    uint32_t step = 0;
    if (out.id.empty() || !parseUint32Strict(stepText, step) || step == 0 || step > 0xFFFFu) {
      return fail(outError, "usage: recovery <incident> <step>");
    }
    if (!rest(line, pos).empty()) return fail(outError, "usage: recovery <incident> <step>");
    out.step = (uint16_t)step;
    out.kind = CommandKind::recovery;
    return true;
  }

  if (verb == "panic") {
    const std::string tail = rest(line, pos);
    if (normalize(tail) == "off") {
      out.kind = CommandKind::panic_off;
      return true;
    }
    out.text = tail;
    out.kind = CommandKind::panic;
    return true;
  }

  if (verb == "lockdown") {
    const std::string mode = nextWord(line, pos);
    if (mode == "on") {
      out.kind = CommandKind::lockdown_on;
    } else if (mode == "off") {
      out.kind = CommandKind::lockdown_off;
    } else {
      return fail(outError, "usage: lockdown on|off [reason]");
    }
    out.text = rest(line, pos);
    return true;
  }

  if (verb == "power") {
    const std::string mode = nextWord(line, pos);
    if (!rest(line, pos).empty()) return fail(outError, "usage: power fail|restored");
    if (mode == "fail") {
      out.kind = CommandKind::power_fail;
      return true;
    }
    if (mode == "restored") {
      out.kind = CommandKind::power_restored;
      return true;
    }
    return fail(outError, "usage: power fail|restored");
  }

  if (verb == "wellbeing") {
    out.id = nextWord(line, pos);
    out.text = rest(line, pos);
    if (out.id.empty() || out.text.empty()) return fail(outError, "usage: wellbeing <check> <response>");
    out.kind = CommandKind::wellbeing;
    return true;
  }

  if (verb == "route") {
    const std::string first = nextWord(line, pos);
    if (first.empty()) return fail(outError, "usage: route <id> clear|blocked | route best [preferred]");
    if (first == "best") {
      out.id = nextWord(line, pos);
      if (!rest(line, pos).empty()) return fail(outError, "usage: route best [preferred]");
      out.kind = CommandKind::route_best;
      return true;
    }
    const std::string state = nextWord(line, pos);
    if (!rest(line, pos).empty()) return fail(outError, "usage: route <id> clear|blocked");
    if (state == "clear") {
      out.cleared = true;
    } else if (state == "blocked") {
      out.cleared = false;
    } else {
      return fail(outError, "usage: route <id> clear|blocked");
    }
    out.id = first;
    out.kind = CommandKind::route_set;
    return true;
  }

  if (verb == "config") {
    out.id = nextWord(line, pos);
    const std::string valueText = nextWord(line, pos);
    if (out.id.empty() || !parseUint32Strict(valueText, out.value) || !rest(line, pos).empty()) {
      return fail(outError, "usage: config <key> <value>");
    }
    out.kind = CommandKind::config_set;
    return true;
  }

  return fail(outError, "unsupported command");
}

const char* helpText() {
  return "commands: sensor <id> <event> [payload] | trigger <type> [reason] | "
         "resolve <incident> [resolution] | recovery <incident> <step> | "
         "panic [source] | panic off | lockdown on|off [reason] | power fail|restored | "
         "wellbeing <check> <response> | route <id> clear|blocked | route best [preferred] | config <key> <value> | status";
}

} // namespace CommandParser
