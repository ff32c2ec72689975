#pragma once
#include <Arduino.h>

#include "app/CommandParser.h"
#include "app/Log.h"

// Routes engine log lines to Serial and traces handled commands.
class Logger {
public:
  void begin(LogLevel level = LogLevel::info);

  void logCommand(const char* origin, const Command& cmd, bool ok, const char* detail);
};
