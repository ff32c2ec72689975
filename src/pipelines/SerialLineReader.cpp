#include "pipelines/SerialLineReader.h"

namespace {
constexpr uint32_t kIdleCommitMs = 40;
}

bool SerialLineReader::poll(uint32_t nowMs, String& outLine) {
  while (Serial.available()) {
    const char c = (char)Serial.read();
    if (c == '\r') continue;

    lastByteMs_ = nowMs;

    if (c == '\n') {
      if (len_ == 0) continue;
      buf_[len_] = '\0';
      outLine = String(buf_);
      len_ = 0;
      return true;
    }

    if (len_ >= (sizeof(buf_) - 1)) {
      len_ = 0;
      Serial.println("[SERIAL] line too long");
      return false;
    }
    buf_[len_++] = c;
  }

  if (len_ > 0 && (nowMs - lastByteMs_) >= kIdleCommitMs) {
    buf_[len_] = '\0';
    outLine = String(buf_);
    len_ = 0;
    return true;
  }

  return false;
}
