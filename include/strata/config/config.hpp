#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "strata/common.hpp"
#include "strata/di/service_container.hpp"
#include "strata/util/logging.hpp"

namespace strata::config {

// Configuration for containers created through ContainerFactory and for logging
class Config {
 public:
  // Default constructor loads from default config file
  Config();

  // Load from specific file; an empty path keeps the defaults
  explicit Config(const std::filesystem::path& config_path);

  // Container defaults
  struct ContainerConfig {
    bool dispose_registered = true;
    bool detect_cycles = false;
    std::string singleton_creation = "racy";  // racy, exclusive
  };
  ContainerConfig container;

  // Logging
  struct LoggingConfig {
    std::string level = "warn";  // spdlog level name
    std::string pattern = util::kDefaultLogPattern;
    std::filesystem::path file;  // relative paths live under Xdg::logDir()
    bool console = true;
  };
  LoggingConfig logging;

  Result<void> load(const std::filesystem::path& config_path);
  Result<void> loadFromString(std::string_view toml_text);
  Result<void> save(const std::filesystem::path& config_path = {}) const;
  Result<void> validate() const;

  // Runtime option structs; call validate() first
  di::ContainerOptions containerOptions() const;
  util::LoggingOptions loggingOptions() const;

  const std::filesystem::path& path() const { return config_path_; }

  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  template <typename Table>
  void apply(const Table& config_data);
};

// Load, validate and install a configuration: container defaults and logging
Result<Config> applyConfig(const std::filesystem::path& config_path);

}  // namespace strata::config
