#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dasigner {

using LogLevel = spdlog::level::level_enum;
using Logger = std::shared_ptr<spdlog::logger>;

// Returns the logger registered under `tag`, creating a colored stdout logger
// on first use. Safe to call from any thread.
Logger CreateLogger(const std::string& tag);

// Applies to every logger created so far and to loggers created later.
void SetLogLevel(LogLevel level);

// Throws std::invalid_argument for names spdlog does not know.
LogLevel ParseLogLevel(const std::string& name);

}  // namespace dasigner
