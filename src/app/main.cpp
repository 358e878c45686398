#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "strata/common.hpp"
#include "strata/config/config.hpp"
#include "strata/di/container_factory.hpp"
#include "strata/di/container_registry.hpp"
#include "strata/di/registry_report.hpp"
#include "strata/util/logging.hpp"

namespace {

using strata::di::ContainerFactory;
using strata::di::ContainerRegistry;
using strata::di::ObjectIdentity;

class IServiceA {
 public:
  virtual ~IServiceA() = default;
  virtual std::string doSomething() const = 0;
};

class ServiceA : public IServiceA {
 public:
  std::string doSomething() const override { return "ServiceA is doing something"; }
};

class IWeapon {
 public:
  virtual ~IWeapon() = default;
  virtual std::string attack() const = 0;
};

class Sword : public IWeapon {
 public:
  std::string attack() const override { return "Sword swings"; }
};

class Bow : public IWeapon {
 public:
  std::string attack() const override { return "Bow fires"; }
};

// Tracked by the UI container and disposed with it
class HudRenderer : public strata::di::Disposable {
 public:
  std::string render() const { return "HUD rendered"; }
  void dispose() override { strata::util::logger()->info("HudRenderer released"); }
};

class GameManager {
 public:
  GameManager(std::shared_ptr<IServiceA> service_a, std::shared_ptr<IWeapon> weapon,
              int runtime_value)
      : service_a_(std::move(service_a)), weapon_(std::move(weapon)), runtime_value_(runtime_value) {}

  void runGame(std::ostream& out) const {
    out << service_a_->doSomething() << '\n';
    if (weapon_) {
      out << weapon_->attack() << '\n';
    }
    out << "GameManager running with runtime value: " << runtime_value_ << '\n';
  }

 private:
  std::shared_ptr<IServiceA> service_a_;
  std::shared_ptr<IWeapon> weapon_;
  int runtime_value_;
};

struct DemoOptions {
  std::string config_file;
  bool verbose = false;
  bool json = false;
};

int runDemo(const DemoOptions& options) {
  if (!options.config_file.empty()) {
    auto config = strata::config::applyConfig(options.config_file);
    if (!config.has_value()) {
      std::cerr << "Failed to load config: " << config.error().message() << std::endl;
      return 1;
    }
  }

  if (options.verbose) {
    strata::util::logger()->set_level(spdlog::level::debug);
  }

  auto& registry = ContainerRegistry::instance();

  auto root = ContainerFactory::createContainer();
  root->registerAsSingletonLazy<IServiceA>([] { return std::make_shared<ServiceA>(); });
  root->registerAsSingletonLazy<IWeapon>([] { return std::make_shared<Sword>(); });

  // Only container so far: resolved through the single-container path
  GameManager(registry.resolve<IServiceA>(), registry.resolve<IWeapon>(), 10).runGame(std::cout);

  auto ui = ContainerFactory::createScopedContainer("Game.UI");
  ui->registerAsTransient<HudRenderer>([] { return std::make_shared<HudRenderer>(); });
  ui->registerAsSingletonLazy<IServiceA>([] { return std::make_shared<ServiceA>(); });

  // "Game.UI.Hud" has no container of its own and falls back to "Game.UI"
  std::cout << registry.resolve<HudRenderer>("Game.UI.Hud")->render() << '\n';

  GameManager player{nullptr, nullptr, 0};
  auto armory = ContainerFactory::createOwnedContainer(ObjectIdentity::of(player));
  armory->registerAsSingleton<IWeapon>(std::make_shared<Bow>());

  {
    auto scope = registry.beginScope(ObjectIdentity::of(player));
    std::cout << registry.resolve<IWeapon>()->attack() << '\n';

    auto nested = registry.beginScope("Game.UI");
    std::cout << registry.resolve<HudRenderer>()->render() << '\n';
    nested.release();
    scope.release();
  }

  auto snapshot = registry.snapshot();
  if (options.json) {
    std::cout << strata::di::describeRegistry(snapshot).dump(2) << std::endl;
  } else {
    std::cout << strata::di::formatRegistry(snapshot);
  }

  armory->dispose();
  ui->dispose();
  root->dispose();

  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"strata-demo - scoped dependency resolution walkthrough"};
  app.set_version_flag("--version", strata::getVersion().toString());

  DemoOptions options;
  app.add_option("--config", options.config_file, "Path to config file");
  app.add_flag("-v,--verbose", options.verbose, "Verbose output");
  app.add_flag("--json", options.json, "Print the registry report as JSON");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  try {
    return runDemo(options);
  } catch (const strata::di::ServiceResolutionException& e) {
    std::cerr << strata::di::formatError(e, options.json) << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
