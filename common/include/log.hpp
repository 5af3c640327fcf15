#pragma once
#include <string>
enum class LogLevel { Info, Warn, Error };
namespace Log {
  // Opens <dir>/<file_name> for append; stdout echo is always on.
  void init(const std::string& dir = "./logs", const std::string& file_name = "log.txt");
  // Name for a per-run log file: <prefix>_YYYYmmdd_HHMMSS.log (local time).
  std::string runFileName(const std::string& prefix);
  void setQuiet(bool quiet);
  void write(LogLevel lvl, const char* fmt, ...);
}
