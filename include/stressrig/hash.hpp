#pragma once

// stressrig/hash.hpp - BLAKE3-backed identifiers.
//
// Domain separation: "marker:" and "logid:" prefixes keep the derived ids
// from colliding with each other for the same input.

#include <string>
#include <string_view>

#include "stressrig/types.hpp"

namespace stressrig {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex BLAKE3 digest.
std::string blake3_hex(std::string_view payload);

// blake3_hex(domain + payload)
std::string hash_domain(std::string_view domain, std::string_view payload);

// 20-char marker shared by every container and remote shell of one stress
// thread. Same run_id + command -> same marker.
std::string shell_marker_for(std::string_view run_id, std::string_view stress_cmd);

// "l<l>-c<c>-k<k>-<8 hex>", unique per (marker, identity).
std::string log_file_id(const InvocationIdentity& id, std::string_view shell_marker);

}  // namespace stressrig
