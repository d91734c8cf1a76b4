#pragma once
#include <string>

namespace playbook {

// Diagnostics to stderr. Operator-facing text does not go through here.
class Logger {
public:
  static Logger& instance();
  void set_verbose(bool v) { verbose_ = v; }
  // DEBUG lines are dropped unless verbose
  void log(const char* level, const std::string& message);

private:
  Logger() = default;
  bool verbose_ = false;
};

} // namespace playbook

#define PLAYBOOK_LOG_WARN(msg)  ::playbook::Logger::instance().log("WARN", msg)
#define PLAYBOOK_LOG_DEBUG(msg) ::playbook::Logger::instance().log("DEBUG", msg)
