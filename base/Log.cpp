#include "Log.h"

#include <cstdio>
#include <iostream>
#include <mutex>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace base
{
  namespace {
    std::mutex& log_mutex() {
      static std::mutex m;
      return m;
    }

    LogSink& log_sink() {
      static LogSink sink;
      return sink;
    }

    // formats into a std::string using va_list (no trailing newline added)
    std::string vformat(const char* fmt, va_list ap) {
      va_list ap_copy;
      va_copy(ap_copy, ap);
      const int needed = std::vsnprintf(nullptr, 0, fmt, ap_copy);
      va_end(ap_copy);
      if (needed <= 0) return std::string();

      std::string s;
      s.resize(static_cast<size_t>(needed));
      std::vsnprintf(s.data(), s.size() + 1, fmt, ap);
      return s;
    }

    const char* prefix(LogLevel level) {
      switch (level) {
      case LogLevel::Warning: return "[warning] ";
      case LogLevel::Error:   return "[error] ";
      default:                return "";
      }
    }

    void write_line(LogLevel level, const std::string& msg) {
      const std::string line = prefix(level) + msg;
      std::lock_guard<std::mutex> lk(log_mutex());
      if (log_sink()) {
        log_sink()(level, line);
        return;
      }
      std::ostream& out = (level == LogLevel::Info) ? std::cout : std::cerr;
      out << line << std::endl;
#if defined(_WIN32)
      OutputDebugStringA(line.c_str());
      OutputDebugStringA("\n");
#endif
    }
  }

  // ------- public API --------
  void Log(const std::string& msg) {
    write_line(LogLevel::Info, msg);
  }

  void VLog(const char* fmt, va_list args) {
    write_line(LogLevel::Info, vformat(fmt, args));
  }

  void Log(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    VLog(fmt, args);
    va_end(args);
  }

  void LogWarning(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    const std::string s = vformat(fmt, args);
    va_end(args);
    write_line(LogLevel::Warning, s);
  }

  void LogError(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    const std::string s = vformat(fmt, args);
    va_end(args);
    write_line(LogLevel::Error, s);
  }

  void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lk(log_mutex());
    log_sink() = std::move(sink);
  }
}
