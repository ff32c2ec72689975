#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "app/Config.h"
#include "app/Outcome.h"

// Runtime-tunable Config fields by short name. Names fit NVS key limits.
namespace ConfigKeys {

size_t count();
const char* name(size_t index);

// validation_failure for an unknown key or a value outside its range.
Outcome apply(Config& cfg, const std::string& key, uint32_t value);
bool read(const Config& cfg, const std::string& key, uint32_t& out);

} // namespace ConfigKeys
