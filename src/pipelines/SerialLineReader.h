#pragma once

#include <Arduino.h>

// Collects Serial bytes into lines. A line also commits after a short idle
// gap so monitors set to "No line ending" still work.
class SerialLineReader {
public:
  bool poll(uint32_t nowMs, String& outLine);

private:
  char buf_[160]{};
  size_t len_ = 0;
  uint32_t lastByteMs_ = 0;
};
