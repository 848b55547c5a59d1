#include "stressrig/log.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stressrig {

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::info)};
std::atomic<Logger::Hook> Logger::hook_{nullptr};
std::mutex Logger::mu_;

namespace {

std::string timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info: return "INFO";
    case LogLevel::warning: return "WARN";
    case LogLevel::error: return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::set_level(LogLevel level) {
  level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() {
  return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::init_from_env() {
  const char* e = std::getenv("STRESSRIG_LOG_LEVEL");
  if (!e || !e[0]) return;
  const std::string v(e);
  if (v == "debug") set_level(LogLevel::debug);
  else if (v == "info") set_level(LogLevel::info);
  else if (v == "warning" || v == "warn") set_level(LogLevel::warning);
  else if (v == "error") set_level(LogLevel::error);
}

void Logger::set_hook(Hook hook) {
  hook_.store(hook, std::memory_order_release);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
  if (static_cast<int>(level) < level_.load(std::memory_order_relaxed)) return;

  std::string line;
  line.reserve(48 + component.size() + message.size());
  line += timestamp_now();
  line += " [";
  line += to_string(level);
  line += "] [";
  line += component;
  line += "] ";
  line += message;

  std::lock_guard<std::mutex> lk(mu_);
  if (Hook hook = hook_.load(std::memory_order_acquire)) {
    hook(level, line);
    return;
  }
  std::cerr << line << '\n';
}

}  // namespace stressrig
