#pragma once
#include <cstdio>
#include <cstdarg>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>

namespace pdf417 {

// Ordered by severity: Logger drops messages below its minimum level.
enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline const char* level_str(LogLevel L){
  switch(L){
    case LogLevel::DEBUG:return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR:return "ERROR";
  }
  return "INFO";
}

// Accepts the names printed by level_str(). Unknown names leave L untouched.
inline bool parse_level(const std::string& s, LogLevel& L){
  if(s=="DEBUG"){ L=LogLevel::DEBUG; return true; }
  if(s=="INFO"){  L=LogLevel::INFO;  return true; }
  if(s=="WARN"){  L=LogLevel::WARN;  return true; }
  if(s=="ERROR"){ L=LogLevel::ERROR; return true; }
  return false;
}

class Logger {
  std::mutex m_;
  FILE* fp_{nullptr};
  LogLevel min_{LogLevel::INFO};
public:
  Logger() = default;
  ~Logger(){ if(fp_) std::fclose(fp_); }
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  bool open(const std::string& path){
    std::lock_guard<std::mutex> lk(m_);
    if(fp_) std::fclose(fp_);
    fp_ = std::fopen(path.c_str(), "w");
    return fp_ != nullptr;
  }

  void set_level(LogLevel L){ std::lock_guard<std::mutex> lk(m_); min_ = L; }

  void log(LogLevel L, const char* fmt, ...){
    std::lock_guard<std::mutex> lk(m_);
    if(L < min_) return;
    FILE* out = fp_ ? fp_ : stderr;
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    char tb[64];
    std::strftime(tb, sizeof(tb), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
    std::fprintf(out, "[%s] [%s] ", tb, level_str(L));
    va_list args; va_start(args, fmt);
    std::vfprintf(out, fmt, args);
    va_end(args);
    std::fprintf(out, "\n");
    std::fflush(out);
  }
};

} // namespace pdf417
