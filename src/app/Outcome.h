#pragma once

#include <stdint.h>

enum class Outcome : uint8_t {
  ok,
  not_found,
  invalid_transition,
  validation_failure
};

static const char* toString(Outcome o) {
  switch (o) {
    case Outcome::ok:                 return "ok";
    case Outcome::not_found:          return "not_found";
    case Outcome::invalid_transition: return "invalid_transition";
    case Outcome::validation_failure: return "validation_failure";
    default:                          return "unknown";
  }
}
