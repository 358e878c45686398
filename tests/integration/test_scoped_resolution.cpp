#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "strata/di/container_factory.hpp"
#include "strata/di/container_registry.hpp"
#include "test_helpers.hpp"

using namespace strata::di;
using namespace strata::test;
using strata::ErrorCode;

namespace {

struct Widget {
  std::shared_ptr<ITestService> service;
};

}  // namespace

class ScopedResolutionTest : public RegistryTest {};

TEST_F(ScopedResolutionTest, ChildScopeResolvesFromParentContainer) {
  auto ui = ContainerFactory::createScopedContainer("App.UI");
  ui->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("x"); });

  auto first = registry().resolve<ITestService>("App.UI.Widgets");
  EXPECT_EQ(first->name(), "x");
  EXPECT_EQ(registry().resolve<ITestService>("App.UI.Widgets"), first);

  ui->dispose();

  EXPECT_DI_ERROR(registry().resolve<ITestService>("App.UI.Widgets"), ErrorCode::kNotRegistered);
}

TEST_F(ScopedResolutionTest, ChildScopeAfterDisposeWithOtherContainers) {
  auto ui = ContainerFactory::createScopedContainer("App.UI");
  ui->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("x"); });
  auto audio = ContainerFactory::createScopedContainer("Audio");
  auto net = ContainerFactory::createScopedContainer("Net");

  EXPECT_EQ(registry().resolve<ITestService>("App.UI.Widgets")->name(), "x");

  ui->dispose();

  EXPECT_DI_ERROR(registry().resolve<ITestService>("App.UI.Widgets"), ErrorCode::kAmbiguousScope);
}

TEST_F(ScopedResolutionTest, LayeredContainersWithAmbientScopes) {
  auto root = ContainerFactory::createScopedContainer("Game");
  root->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("root"); });

  auto ui = ContainerFactory::createScopedContainer("Game.UI");
  ui->registerAsTransient<Widget>([](IServiceContainer&) {
    // Dependencies the UI container lacks come from the registry's view of the scope
    return std::make_shared<Widget>(Widget{ContainerRegistry::instance().resolve<ITestService>()});
  });

  auto scope = registry().beginScope("Game.UI.Hud");
  auto widget = registry().resolve<Widget>();
  ASSERT_NE(widget->service, nullptr);
  EXPECT_EQ(widget->service->name(), "root");
  scope.release();

  // Without an ambient scope two containers are ambiguous
  EXPECT_DI_ERROR(registry().resolve<Widget>(), ErrorCode::kAmbiguousScope);
}

TEST_F(ScopedResolutionTest, OwnerScopeNestedInsideNamespaceScope) {
  TestService player("player");
  auto game = ContainerFactory::createScopedContainer("Game");
  game->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("game"); });

  auto personal = ContainerFactory::createOwnedContainer(ObjectIdentity::of(player));
  personal->registerAsSingleton<ITestService>(std::make_shared<TestService>("personal"));

  auto outer = registry().beginScope("Game");
  EXPECT_EQ(registry().resolve<ITestService>()->name(), "game");

  {
    auto inner = registry().beginScope(ObjectIdentity::of(player));
    EXPECT_EQ(registry().resolve<ITestService>()->name(), "personal");
  }

  EXPECT_EQ(registry().resolve<ITestService>()->name(), "game");
  outer.release();
}

TEST_F(ScopedResolutionTest, WorkerThreadUsesItsOwnAmbientScope) {
  auto left = ContainerFactory::createScopedContainer("Left");
  left->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("left"); });
  auto right = ContainerFactory::createScopedContainer("Right");
  right->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("right"); });

  auto main_scope = registry().beginScope("Left");

  std::string seen;
  std::thread worker([&seen] {
    auto scope = ContainerRegistry::instance().beginScope("Right");
    seen = ContainerRegistry::instance().resolve<ITestService>()->name();
  });
  worker.join();

  EXPECT_EQ(seen, "right");
  EXPECT_EQ(registry().resolve<ITestService>()->name(), "left");
}

TEST_F(ScopedResolutionTest, RegistryResetDropsEveryThreadsScope) {
  auto app = ContainerFactory::createScopedContainer("App");
  auto other = ContainerFactory::createScopedContainer("Other");

  auto scope = registry().beginScope("App");
  registry().dispose();

  EXPECT_EQ(ScopeController::depth(), 0u);
  EXPECT_EQ(registry().containerCount(), 0u);

  // Containers still registered their dispose callbacks; disposing them now is harmless
  app->dispose();
  other->dispose();
  scope.release();
}

TEST_F(ScopedResolutionTest, DisposalOrderAcrossLayers) {
  auto log = std::make_shared<DisposeLog>();
  auto ui = ContainerFactory::createScopedContainer("App.UI");
  int next = 0;
  ui->registerAsTransient<DisposableTestService>(
      [log, &next] { return std::make_shared<DisposableTestService>(++next, log); });

  registry().resolve<DisposableTestService>("App.UI.A");
  registry().resolve<DisposableTestService>("App.UI.B");
  registry().resolve<DisposableTestService>("App.UI");

  ui->dispose();
  ui->dispose();

  EXPECT_EQ(log->entries(), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(registry().containerCount(), 0u);
}
