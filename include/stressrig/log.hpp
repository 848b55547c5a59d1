#pragma once

// stressrig/log.hpp - Level-filtered, thread-safe line logger.
//
// Line format: "<YYYY-mm-dd HH:MM:SS.mmm> [LEVEL] [component] message"
// Threshold: STRESSRIG_LOG_LEVEL=debug|info|warning|error (default info),
// read once by init_from_env(); set_level() overrides it.
//
// Lines go to stderr unless a hook is installed. The level check happens
// before the lock, so filtered messages cost one atomic load.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace stressrig {

enum class LogLevel {
  debug = 0,
  info = 1,
  warning = 2,
  error = 3,
};

std::string to_string(LogLevel level);

class Logger {
 public:
  using Hook = void (*)(LogLevel level, const std::string& line);

  static void set_level(LogLevel level);
  static LogLevel level();
  static void init_from_env();

  // Replaces stderr output. Pass nullptr to restore it.
  static void set_hook(Hook hook);

  static void log(LogLevel level, std::string_view component, std::string_view message);

  static void debug(std::string_view component, std::string_view message) {
    log(LogLevel::debug, component, message);
  }
  static void info(std::string_view component, std::string_view message) {
    log(LogLevel::info, component, message);
  }
  static void warning(std::string_view component, std::string_view message) {
    log(LogLevel::warning, component, message);
  }
  static void error(std::string_view component, std::string_view message) {
    log(LogLevel::error, component, message);
  }

 private:
  static std::atomic<int> level_;
  static std::atomic<Hook> hook_;
  static std::mutex mu_;
};

}  // namespace stressrig
