#include "stressrig/hash.hpp"

#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace stressrig {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  uint8_t out[BLAKE3_OUT_LEN];
  blake3_hasher_finalize(&hasher, out, BLAKE3_OUT_LEN);
  return to_hex(out, BLAKE3_OUT_LEN);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  uint8_t out[BLAKE3_OUT_LEN];
  blake3_hasher_finalize(&hasher, out, BLAKE3_OUT_LEN);
  return to_hex(out, BLAKE3_OUT_LEN);
}

std::string shell_marker_for(std::string_view run_id, std::string_view stress_cmd) {
  std::string payload;
  payload.reserve(run_id.size() + 1 + stress_cmd.size());
  payload += run_id;
  payload += '\n';
  payload += stress_cmd;
  return hash_domain("marker:", payload).substr(0, 20);
}

std::string log_file_id(const InvocationIdentity& id, std::string_view shell_marker) {
  const std::string base = id.short_id();
  std::string payload(shell_marker);
  payload += '/';
  payload += base;
  return base + "-" + hash_domain("logid:", payload).substr(0, 8);
}

}  // namespace stressrig
