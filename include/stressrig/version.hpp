#pragma once

// stressrig/version.hpp - Version manifest.
//
// EVENT_SCHEMA_VERSION covers the JSON lines written to the event log; bump it
// when a field is removed or changes meaning. Adding fields does not bump it.

#include <cstdint>
#include <string>

namespace stressrig {
namespace version {

constexpr const char* SEMVER = "0.3.0";
constexpr uint32_t EVENT_SCHEMA_VERSION = 1;

// {"semver":"...","event_schema":1,"hash_primitive":"blake3","hash_version":"...",
//  "log_archival":true|false}
std::string manifest_json();

}  // namespace version
}  // namespace stressrig
