#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>

static std::mutex g_m;
static std::ofstream g_file;
static bool g_quiet = false;

void Log::init(const std::string& dir, const std::string& file_name) {
  std::scoped_lock lk(g_m);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (g_file.is_open()) g_file.close();
  g_file.open(dir + "/" + file_name, std::ios::app);
  if (!g_file.is_open()) {
    std::cerr << "[W] could not open log file " << dir << "/" << file_name << "\n";
  }
}

std::string Log::runFileName(const std::string& prefix) {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
  return prefix + "_" + stamp + ".log";
}

void Log::setQuiet(bool quiet) {
  std::scoped_lock lk(g_m);
  g_quiet = quiet;
}

void Log::write(LogLevel lvl, const char* fmt, ...) {
  std::scoped_lock lk(g_m);
  const char* tag = (lvl==LogLevel::Info)?"I":(lvl==LogLevel::Warn)?"W":"E";
  char buf[2048];
  va_list ap; va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  // quiet drops Info from the console only; the file keeps everything
  if (!g_quiet || lvl != LogLevel::Info) std::cout << "[" << tag << "] " << buf << "\n";
  if (g_file.is_open()) g_file << "[" << tag << "] " << buf << "\n";
}
