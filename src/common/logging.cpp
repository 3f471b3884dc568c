#include "logging.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <string>

namespace tessera {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) {
  level_.store(lvl, std::memory_order_relaxed);
}

void Logger::set_level_by_name(const char *name) {
  std::string s = name ? name : "";
  for (auto &ch : s)
    ch = (char)std::tolower((unsigned char)ch);
  if (s == "trace")
    set_level(LogLevel::TRACE);
  else if (s == "debug")
    set_level(LogLevel::DEBUG);
  else if (s == "warn" || s == "warning")
    set_level(LogLevel::WARN);
  else if (s == "error" || s == "err")
    set_level(LogLevel::ERROR);
  else
    set_level(LogLevel::INFO);
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level())
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(stderr, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

} // namespace tessera
