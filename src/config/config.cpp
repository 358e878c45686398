#include "strata/config/config.hpp"

#include <fstream>

#include <toml++/toml.hpp>

#include "strata/di/container_factory.hpp"
#include "strata/util/xdg.hpp"

namespace strata::config {

namespace {

std::optional<di::SingletonCreation> parseSingletonCreation(const std::string& value) {
  if (value == "racy") {
    return di::SingletonCreation::kRacy;
  }
  if (value == "exclusive") {
    return di::SingletonCreation::kExclusive;
  }
  return std::nullopt;
}

}  // namespace

template <typename Table>
void Config::apply(const Table& config_data) {
  if (auto container_table = config_data["container"].as_table()) {
    if (auto value = (*container_table)["dispose_registered"].template value<bool>()) {
      container.dispose_registered = *value;
    }
    if (auto value = (*container_table)["detect_cycles"].template value<bool>()) {
      container.detect_cycles = *value;
    }
    if (auto value = (*container_table)["singleton_creation"].template value<std::string>()) {
      container.singleton_creation = *value;
    }
  }

  if (auto logging_table = config_data["logging"].as_table()) {
    if (auto value = (*logging_table)["level"].template value<std::string>()) {
      logging.level = *value;
    }
    if (auto value = (*logging_table)["pattern"].template value<std::string>()) {
      logging.pattern = *value;
    }
    if (auto value = (*logging_table)["file"].template value<std::string>()) {
      logging.file = *value;
    }
    if (auto value = (*logging_table)["console"].template value<bool>()) {
      logging.console = *value;
    }
  }
}

Config::Config() {
  // Try to load from default location
  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    if (!result.has_value()) {
      util::logger()->warn("Ignoring config file {}: {}", default_path.string(),
                           result.error().message());
    }
  }
}

Config::Config(const std::filesystem::path& config_path) {
  if (config_path.empty()) {
    return;
  }
  auto result = load(config_path);
  if (!result.has_value()) {
    // Continue with defaults; explicit callers should use load() to see the error
    util::logger()->warn("Using default configuration: {}", result.error().message());
  }
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    apply(config_data);
    return {};
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::loadFromString(std::string_view toml_text) {
  try {
    auto config_data = toml::parse(toml_text);
    apply(config_data);
    return {};
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    auto container_table = toml::table{};
    container_table.insert_or_assign("dispose_registered", container.dispose_registered);
    container_table.insert_or_assign("detect_cycles", container.detect_cycles);
    container_table.insert_or_assign("singleton_creation", container.singleton_creation);
    config_data.insert_or_assign("container", container_table);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    logging_table.insert_or_assign("pattern", logging.pattern);
    logging_table.insert_or_assign("file", logging.file.string());
    logging_table.insert_or_assign("console", logging.console);
    config_data.insert_or_assign("logging", logging_table);

    // Ensure parent directory exists
    auto parent = save_path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
      std::filesystem::create_directories(parent);
    }

    std::ofstream out(save_path, std::ios::trunc);
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot write config file: " + save_path.string()));
    }
    out << config_data << '\n';
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed writing config file: " + save_path.string()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (!parseSingletonCreation(container.singleton_creation)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid singleton_creation: " + container.singleton_creation +
                                         " (expected racy or exclusive)"));
  }

  if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid logging level: " + logging.level));
  }

  if (logging.pattern.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Logging pattern cannot be empty"));
  }

  if (!logging.console && logging.file.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Logging needs a console or a file sink"));
  }

  return {};
}

di::ContainerOptions Config::containerOptions() const {
  di::ContainerOptions options;
  options.dispose_registered = container.dispose_registered;
  options.detect_cycles = container.detect_cycles;
  options.singleton_creation =
      parseSingletonCreation(container.singleton_creation).value_or(di::SingletonCreation::kRacy);
  return options;
}

util::LoggingOptions Config::loggingOptions() const {
  util::LoggingOptions options;
  options.level = spdlog::level::from_str(logging.level);
  options.pattern = logging.pattern;
  options.console = logging.console;
  if (!logging.file.empty()) {
    options.file = logging.file.is_relative() ? util::Xdg::logDir() / logging.file : logging.file;
  }
  return options;
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

Result<Config> applyConfig(const std::filesystem::path& config_path) {
  Config config{std::filesystem::path{}};
  auto load_result = config.load(config_path);
  if (!load_result.has_value()) {
    return std::unexpected(load_result.error());
  }

  auto validation = config.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  util::initializeLogging(config.loggingOptions());
  di::ContainerFactory::setDefaultOptions(config.containerOptions());

  return config;
}

}  // namespace strata::config
