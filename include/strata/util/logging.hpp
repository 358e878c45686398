#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace strata::util {

inline constexpr const char* kLoggerName = "strata";
inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

struct LoggingOptions {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::string pattern = kDefaultLogPattern;
  std::filesystem::path file;  // empty: no file sink
  bool console = true;
};

// (Re)build the "strata" logger from options
void initializeLogging(const LoggingOptions& options);

// Logger used by the library; created with console defaults on first use
std::shared_ptr<spdlog::logger> logger();

}  // namespace strata::util
