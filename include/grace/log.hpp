/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for GRACE (loghelper-compatible interface).
 * Provides GRACE_LOG_DEBUG, GRACE_LOG_INFO, GRACE_LOG_WARN, GRACE_LOG_ERROR macros.
 */

#ifndef GRACE_LOG_HPP_
#define GRACE_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace grace {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  // Messages below the threshold are dropped. Default: kInfo.
  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }
  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(threshold().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level) || level == Level::kOff) {
      return;
    }
    const char* prefix[] = {"[GRACE DEBUG]", "[GRACE INFO]", "[GRACE WARN]", "[GRACE ERROR]"};
    // Accept and shutdown threads log concurrently; keep lines whole.
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& sink_mutex() {
    static std::mutex mtx;
    return mtx;
  }
};

#define GRACE_LOG_DEBUG(msg) ::grace::Logger::log(::grace::Logger::Level::kDebug, msg)
#define GRACE_LOG_INFO(msg) ::grace::Logger::log(::grace::Logger::Level::kInfo, msg)
#define GRACE_LOG_WARN(msg) ::grace::Logger::log(::grace::Logger::Level::kWarn, msg)
#define GRACE_LOG_ERROR(msg) ::grace::Logger::log(::grace::Logger::Level::kError, msg)

}  // namespace grace

#endif  // GRACE_LOG_HPP_
