#include "stressrig/archive.hpp"

#include <fstream>
#include <iterator>

#if defined(STRESSRIG_WITH_ZSTD)
#include <zstd.h>
#endif

namespace stressrig {

namespace {
#if defined(STRESSRIG_WITH_ZSTD)
constexpr int kZstdLevel = 3;

bool compress_zstd(const std::string& data, std::string& out) {
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), kZstdLevel);
  if (ZSTD_isError(n)) return false;
  out.resize(n);
  return true;
}
#endif
}  // namespace

bool log_archival_available() {
#if defined(STRESSRIG_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

std::string archive_log(const std::string& path, std::string* error) {
#if defined(STRESSRIG_WITH_ZSTD)
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot read " + path;
    return "";
  }
  const std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  std::string packed;
  if (!compress_zstd(data, packed)) {
    if (error) *error = "zstd compression failed for " + path;
    return "";
  }
  const std::string target = path + ".zst";
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  ofs.write(packed.data(), static_cast<std::streamsize>(packed.size()));
  if (!ofs) {
    if (error) *error = "cannot write " + target;
    return "";
  }
  return target;
#else
  (void)path;
  if (error) *error = "zstd_unavailable";
  return "";
#endif
}

}  // namespace stressrig
