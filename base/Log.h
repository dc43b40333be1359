#pragma once

#include "base.h"

#include <cstdarg>
#include <functional>
#include <string>

namespace base
{
  enum class LogLevel { Info, Warning, Error };

  // receives one finished line, level prefix already applied
  using LogSink = std::function<void(LogLevel, const std::string&)>;

  DLL_BASE void Log(const std::string& msg);
  DLL_BASE void VLog(const char* fmt, va_list args);
  DLL_BASE void Log(const char* fmt, ...);
  DLL_BASE void LogWarning(const char* fmt, ...);
  DLL_BASE void LogError(const char* fmt, ...);

  // Replaces stdout as the destination. Called under the log mutex, so the sink must not log.
  // An empty sink restores stdout.
  DLL_BASE void SetLogSink(LogSink sink);
}
