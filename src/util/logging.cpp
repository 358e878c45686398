#include "strata/util/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata::util {

namespace {

std::mutex& loggerMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger>& currentLogger() {
  static std::shared_ptr<spdlog::logger> instance;
  return instance;
}

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto console_logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
  console_logger->set_pattern(kDefaultLogPattern);
  console_logger->set_level(spdlog::level::warn);
  return console_logger;
}

}  // namespace

void initializeLogging(const LoggingOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;

  if (options.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  std::string file_error;
  if (!options.file.empty()) {
    try {
      if (options.file.has_parent_path()) {
        std::filesystem::create_directories(options.file.parent_path());
      }
      // 5MB files, 3 backups
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), 1024 * 1024 * 5, 3));
    } catch (const std::exception& e) {
      file_error = e.what();
    }
  }

  // Fallback to console-only logging if file setup fails
  if (sinks.empty() && !file_error.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  auto configured = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  configured->set_pattern(options.pattern);
  configured->set_level(options.level);

  if (!file_error.empty()) {
    configured->warn("Failed to setup file logging: {}", file_error);
  }

  std::lock_guard<std::mutex> lock(loggerMutex());
  currentLogger() = std::move(configured);
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(loggerMutex());
  auto& instance = currentLogger();
  if (!instance) {
    instance = makeConsoleLogger();
  }
  return instance;
}

}  // namespace strata::util
