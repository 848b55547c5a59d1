#include "stressrig/version.hpp"

#include <sstream>

#include "stressrig/archive.hpp"
#include "stressrig/hash.hpp"

namespace stressrig {
namespace version {

std::string manifest_json() {
  const auto h = hash_runtime_info();
  std::ostringstream o;
  o << "{\"semver\":\"" << SEMVER << "\""
    << ",\"event_schema\":" << EVENT_SCHEMA_VERSION
    << ",\"hash_primitive\":\"" << h.primitive << "\""
    << ",\"hash_version\":\"" << h.version << "\""
    << ",\"log_archival\":" << (log_archival_available() ? "true" : "false")
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace stressrig
