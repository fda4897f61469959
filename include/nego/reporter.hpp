#pragma once
#include <cstdint>
#include <iostream>
#include <string>

namespace nego {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warning = 2, Error = 3 };

inline const char* to_string(LogLevel l) noexcept {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}

// Log sink handed to parties by their host.
class Reporter {
public:
  virtual ~Reporter() = default;
  virtual void log(LogLevel level, const std::string& msg) = 0;
};

class StreamReporter final : public Reporter {
public:
  explicit StreamReporter(std::ostream& os = std::clog, LogLevel min_level = LogLevel::Info)
    : os_(os), min_level_(min_level) {}

  void log(LogLevel level, const std::string& msg) override {
    if (level < min_level_) return;
    os_ << "[" << to_string(level) << "] " << msg << "\n";
  }

private:
  std::ostream& os_;
  LogLevel min_level_{LogLevel::Info};
};

class NullReporter final : public Reporter {
public:
  void log(LogLevel, const std::string&) override {}
};

} // namespace nego
