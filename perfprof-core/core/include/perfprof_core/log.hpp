#pragma once
#include <atomic>
#include <cstdio>
#include <format>
#include <string>
#include <utility>

enum class LogLevel { Debug, Warn };

// Callback receiving one formatted message (no trailing newline)
using LogCallback = void (*)(LogLevel level, const char* message);

// When null, warnings go to stderr and debug messages are dropped
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
  g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() { g_log_callback.store(nullptr, std::memory_order_release); }

template <typename... Args>
void log_message(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
  std::string message = std::format(fmt, std::forward<Args>(args)...);

  LogCallback cb = g_log_callback.load(std::memory_order_acquire);
  if (cb) {
    cb(level, message.c_str());
  } else if (level == LogLevel::Warn) {
    std::fprintf(stderr, "[perfprof][warn] %s\n", message.c_str());
  }
}

#ifdef PERFPROF_ENABLE_DEBUG_OUTPUT
#  define PERFPROF_DEBUG_LOG(...) ::log_message(LogLevel::Debug, __VA_ARGS__)
#else
#  define PERFPROF_DEBUG_LOG(...) ((void)0)
#endif
