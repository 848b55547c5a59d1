#pragma once

// stressrig/archive.hpp - Compression of finished stress logs.
//
// Built with STRESSRIG_WITH_ZSTD: archive_log() writes <path>.zst next to the
// log and leaves the original in place. Without it, archive_log() reports
// "zstd_unavailable" and does nothing.

#include <string>

namespace stressrig {

bool log_archival_available();

// Returns the archive path, or an empty string with *error set.
std::string archive_log(const std::string& path, std::string* error = nullptr);

}  // namespace stressrig
