#include "playbook/log.hpp"

#include <cstring>
#include <ctime>
#include <iostream>

namespace playbook {

Logger& Logger::instance(){
  static Logger logger;
  return logger;
}

void Logger::log(const char* level, const std::string& message){
  if(!verbose_ && std::strcmp(level, "DEBUG") == 0) return;

  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);

  std::cerr << "[" << buf << "] [" << level << "] " << message << "\n";
}

} // namespace playbook
