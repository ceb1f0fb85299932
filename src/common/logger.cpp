#include "dasigner/common/logger.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dasigner {
namespace {

std::mutex& RegistryMutex() {
  static std::mutex mu;
  return mu;
}

}  // namespace

Logger CreateLogger(const std::string& tag) {
  std::lock_guard<std::mutex> lock(RegistryMutex());
  Logger logger = spdlog::get(tag);
  if (logger == nullptr) {
    logger = spdlog::stdout_color_mt(tag);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][th:%t][%l] %n %v");
    logger->set_level(spdlog::get_level());
  }
  return logger;
}

void SetLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(RegistryMutex());
  spdlog::set_level(level);
}

LogLevel ParseLogLevel(const std::string& name) {
  const LogLevel level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

}  // namespace dasigner
