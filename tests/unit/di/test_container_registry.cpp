#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include "strata/di/container_registry.hpp"
#include "strata/di/service_container.hpp"
#include "test_helpers.hpp"

using namespace strata::di;
using namespace strata::test;
using strata::ErrorCode;

namespace {

std::shared_ptr<ServiceContainer> containerNamed(const std::string& name) {
  auto container = std::make_shared<ServiceContainer>();
  container->registerAsSingletonLazy<ITestService>([name] { return std::make_shared<TestService>(name); });
  return container;
}

struct Dependency {};

struct NeedsDependency {
  std::shared_ptr<Dependency> dependency;
};

class FailingDisposable : public Disposable {
 public:
  void dispose() override { throw std::runtime_error("released at exit"); }
};

}  // namespace

class ContainerRegistryTest : public RegistryTest {};

TEST_F(ContainerRegistryTest, SingleContainerResolvesWithoutScope) {
  registry().registerContainer(containerNamed("only"));

  EXPECT_EQ(registry().containerCount(), 1u);
  EXPECT_EQ(registry().resolve<ITestService>()->name(), "only");
  EXPECT_TRUE(registry().snapshot().single_container_fast_path);
}

TEST_F(ContainerRegistryTest, SingleScopedContainerServesUnknownNamespace) {
  registry().registerContainer(containerNamed("scoped"), std::string("App"));

  EXPECT_EQ(registry().resolve<ITestService>("Elsewhere")->name(), "scoped");
  EXPECT_EQ(registry().resolve<ITestService>("")->name(), "scoped");
}

TEST_F(ContainerRegistryTest, EmptyRegistry) {
  EXPECT_DI_ERROR(registry().resolve<ITestService>(), ErrorCode::kNotRegistered);
  EXPECT_DI_ERROR(registry().resolve<ITestService>("App"), ErrorCode::kNotRegistered);

  std::shared_ptr<ITestService> out;
  EXPECT_FALSE(registry().tryResolve(out));
}

TEST_F(ContainerRegistryTest, MultipleContainersWithoutScopeAreAmbiguous) {
  registry().registerContainer(containerNamed("one"));
  registry().registerContainer(containerNamed("two"));

  EXPECT_FALSE(registry().snapshot().single_container_fast_path);
  EXPECT_DI_ERROR(registry().resolve<ITestService>(), ErrorCode::kAmbiguousScope);
  EXPECT_DI_ERROR(registry().resolve<ITestService>("Unknown"), ErrorCode::kAmbiguousScope);

  // Ambiguity is not a missing registration
  std::shared_ptr<ITestService> out;
  EXPECT_DI_ERROR(registry().tryResolve(out), ErrorCode::kAmbiguousScope);
}

TEST_F(ContainerRegistryTest, NullContainerRejected) {
  EXPECT_DI_ERROR(registry().registerContainer(nullptr), ErrorCode::kInvalidArgument);
}

TEST_F(ContainerRegistryTest, WhitespaceScopeRejected) {
  EXPECT_DI_ERROR(registry().registerContainer(containerNamed("x"), std::string("  ")),
                  ErrorCode::kInvalidArgument);
  EXPECT_DI_ERROR(registry().resolve<ITestService>(" \t"), ErrorCode::kInvalidArgument);
  EXPECT_EQ(registry().containerCount(), 0u);
}

TEST_F(ContainerRegistryTest, DuplicateNamespaceRejected) {
  registry().registerContainer(containerNamed("first"), std::string("App.UI"));

  EXPECT_DI_ERROR(registry().registerContainer(containerNamed("second"), std::string("App.UI")),
                  ErrorCode::kDuplicateRegistration);

  EXPECT_EQ(registry().containerCount(), 1u);
  EXPECT_EQ(registry().resolve<ITestService>("App.UI")->name(), "first");
}

TEST_F(ContainerRegistryTest, DuplicateContainerRejected) {
  auto container = containerNamed("same");
  registry().registerContainer(container, std::string("A"));

  EXPECT_DI_ERROR(registry().registerContainer(container, std::string("B")),
                  ErrorCode::kDuplicateRegistration);
  EXPECT_EQ(registry().containerCount(), 1u);
}

TEST_F(ContainerRegistryTest, DuplicateOwnerRejected) {
  TestService owner;
  registry().registerContainer(containerNamed("first"), std::nullopt, ObjectIdentity::of(owner));

  // A failed registration leaves no partial state behind
  EXPECT_DI_ERROR(registry().registerContainer(containerNamed("second"), std::string("Fresh"),
                                               ObjectIdentity::of(owner)),
                  ErrorCode::kDuplicateRegistration);
  EXPECT_EQ(registry().containerCount(), 1u);
  EXPECT_EQ(registry().resolve<ITestService>("Fresh")->name(), "first");
}

TEST_F(ContainerRegistryTest, MostSpecificAncestorWins) {
  registry().registerContainer(containerNamed("a"), std::string("a"));
  registry().registerContainer(containerNamed("a.b"), std::string("a.b"));

  EXPECT_EQ(registry().resolve<ITestService>("a.b.c")->name(), "a.b");
  EXPECT_EQ(registry().resolve<ITestService>("a.x")->name(), "a");
  EXPECT_EQ(registry().resolve<ITestService>("a")->name(), "a");
}

TEST_F(ContainerRegistryTest, SegmentsAreNotPrefixes) {
  registry().registerContainer(containerNamed("app"), std::string("App"));
  registry().registerContainer(containerNamed("other"), std::string("Other"));

  // "Apple" is not a child of "App"
  EXPECT_DI_ERROR(registry().resolve<ITestService>("Apple"), ErrorCode::kAmbiguousScope);
}

TEST_F(ContainerRegistryTest, ChainFallsThroughToAncestors) {
  auto outer = std::make_shared<ServiceContainer>();
  outer->registerAsSingletonLazy<ITestService>([] { return std::make_shared<TestService>("outer"); });
  auto inner = std::make_shared<ServiceContainer>();
  inner->registerAsTransient<OtherService>([] { return std::make_shared<OtherService>(); });

  registry().registerContainer(outer, std::string("App"));
  registry().registerContainer(inner, std::string("App.UI"));

  EXPECT_EQ(registry().resolve<ITestService>("App.UI")->name(), "outer");
  EXPECT_NE(registry().resolve<OtherService>("App.UI"), nullptr);
  EXPECT_DI_ERROR(registry().resolve<OtherService>("App"), ErrorCode::kNotRegistered);
}

TEST_F(ContainerRegistryTest, ChainCacheFollowsMutations) {
  registry().registerContainer(containerNamed("a"), std::string("a"));
  registry().registerContainer(containerNamed("unrelated"), std::string("z"));

  EXPECT_EQ(registry().resolve<ITestService>("a.b.c")->name(), "a");
  EXPECT_GE(registry().snapshot().cached_chains, 1u);

  auto closer = containerNamed("a.b");
  registry().registerContainer(closer, std::string("a.b"));
  EXPECT_EQ(registry().resolve<ITestService>("a.b.c")->name(), "a.b");

  registry().unregisterContainer(closer.get());
  EXPECT_EQ(registry().resolve<ITestService>("a.b.c")->name(), "a");
}

TEST_F(ContainerRegistryTest, OwnerScope) {
  TestService owner;
  TestService stranger;
  registry().registerContainer(containerNamed("owned"), std::nullopt, ObjectIdentity::of(owner));
  registry().registerContainer(containerNamed("root"));

  EXPECT_EQ(registry().resolve<ITestService>(ObjectIdentity::of(owner))->name(), "owned");
  EXPECT_DI_ERROR(registry().resolve<ITestService>(ObjectIdentity::of(stranger)),
                  ErrorCode::kNotRegistered);
}

TEST_F(ContainerRegistryTest, AmbientNamespaceScope) {
  registry().registerContainer(containerNamed("ui"), std::string("App.UI"));
  registry().registerContainer(containerNamed("net"), std::string("App.Net"));

  auto ui = registry().beginScope("App.UI.Widgets");
  EXPECT_EQ(registry().resolve<ITestService>()->name(), "ui");

  {
    auto net = registry().beginScope("App.Net");
    EXPECT_EQ(registry().resolve<ITestService>()->name(), "net");
  }

  EXPECT_EQ(registry().resolve<ITestService>()->name(), "ui");
  ui.release();

  EXPECT_DI_ERROR(registry().resolve<ITestService>(), ErrorCode::kAmbiguousScope);
}

TEST_F(ContainerRegistryTest, AmbientObjectScope) {
  TestService owner;
  registry().registerContainer(containerNamed("owned"), std::nullopt, ObjectIdentity::of(owner));
  registry().registerContainer(containerNamed("root"));

  auto scope = registry().beginScope(ObjectIdentity::of(owner));
  EXPECT_EQ(registry().resolve<ITestService>()->name(), "owned");
}

TEST_F(ContainerRegistryTest, AmbientScopeRejectsWhitespace) {
  EXPECT_DI_ERROR(auto handle = registry().beginScope("   "), ErrorCode::kInvalidArgument);
  EXPECT_EQ(strata::di::ScopeController::depth(), 0u);
}

TEST_F(ContainerRegistryTest, TryResolveReportsMissingDependencyOfRegisteredType) {
  auto container = std::make_shared<ServiceContainer>();
  container->registerAsTransient<NeedsDependency>([](IServiceContainer& c) {
    return std::make_shared<NeedsDependency>(NeedsDependency{c.resolve<Dependency>()});
  });
  registry().registerContainer(container);

  std::shared_ptr<NeedsDependency> out;
  EXPECT_DI_ERROR(container->tryResolve(out), ErrorCode::kNotRegistered);
  EXPECT_DI_ERROR(registry().tryResolve(out), ErrorCode::kNotRegistered);

  // The type itself being absent is still a plain false
  std::shared_ptr<Dependency> missing;
  EXPECT_FALSE(registry().tryResolve(missing));
}

TEST_F(ContainerRegistryTest, TryResolveInAmbientScopeReportsMissingDependency) {
  auto ui = containerNamed("ui");
  ui->registerAsTransient<NeedsDependency>([](IServiceContainer& c) {
    return std::make_shared<NeedsDependency>(NeedsDependency{c.resolve<Dependency>()});
  });
  registry().registerContainer(ui, std::string("App.UI"));
  registry().registerContainer(containerNamed("net"), std::string("App.Net"));

  auto scope = registry().beginScope("App.UI.Panel");
  std::shared_ptr<NeedsDependency> out;
  EXPECT_DI_ERROR(registry().tryResolve(out), ErrorCode::kNotRegistered);
  EXPECT_EQ(out, nullptr);
}

TEST_F(ContainerRegistryTest, OwnerAndItsFirstMemberOwnSeparateContainers) {
  struct Session {
    int id = 7;
    int flags = 0;
  };
  Session session;

  registry().registerContainer(containerNamed("session"), std::nullopt, ObjectIdentity::of(session));
  registry().registerContainer(containerNamed("id"), std::nullopt, ObjectIdentity::of(session.id));

  EXPECT_EQ(registry().resolve<ITestService>(ObjectIdentity::of(session))->name(), "session");
  EXPECT_EQ(registry().resolve<ITestService>(ObjectIdentity::of(session.id))->name(), "id");
}

TEST_F(ContainerRegistryTest, ContainersLeftAtExitAreReleasedCleanly) {
  EXPECT_EXIT(
      {
        auto container = std::make_shared<ServiceContainer>();
        container->registerAsSingletonLazy<FailingDisposable>(
            [] { return std::make_shared<FailingDisposable>(); });
        container->resolve<FailingDisposable>();
        registry().registerContainer(container, std::string("Leftover"));
        container.reset();
        std::exit(0);
      },
      ::testing::ExitedWithCode(0), "");
}

TEST_F(ContainerRegistryTest, UnregisterUnknownIsNoOp) {
  auto container = containerNamed("never registered");
  registry().unregisterContainer(container.get());
  registry().unregisterContainer(nullptr);
  EXPECT_EQ(registry().containerCount(), 0u);
}

TEST_F(ContainerRegistryTest, ResolveFromHeldContainer) {
  auto container = containerNamed("held");
  EXPECT_EQ(ContainerRegistry::resolveFrom<ITestService>(container.get())->name(), "held");

  std::shared_ptr<OtherService> out;
  EXPECT_FALSE(ContainerRegistry::tryResolveFrom(container.get(), out));

  EXPECT_DI_ERROR(ContainerRegistry::resolveFrom<ITestService>(nullptr), ErrorCode::kInvalidArgument);
}

TEST_F(ContainerRegistryTest, DisposeForgetsContainersButKeepsThemUsable) {
  auto container = containerNamed("kept");
  registry().registerContainer(container, std::string("App"));
  auto scope = registry().beginScope("App");

  registry().dispose();

  EXPECT_EQ(registry().containerCount(), 0u);
  EXPECT_EQ(strata::di::ScopeController::current(), nullptr);
  EXPECT_DI_ERROR(registry().resolve<ITestService>("App"), ErrorCode::kNotRegistered);
  EXPECT_EQ(container->resolve<ITestService>()->name(), "kept");

  // The stale handle releases quietly
  scope.release();
}

TEST_F(ContainerRegistryTest, SnapshotDescribesContainers) {
  TestService owner;
  registry().registerContainer(containerNamed("b"), std::string("B"));
  registry().registerContainer(containerNamed("a"), std::string("A"), ObjectIdentity::of(owner));

  auto snapshot = registry().snapshot();
  ASSERT_EQ(snapshot.containers.size(), 2u);
  EXPECT_EQ(snapshot.containers[0].namespace_scope, "A");
  ASSERT_TRUE(snapshot.containers[0].scope_owner_type.has_value());
  EXPECT_NE(snapshot.containers[0].scope_owner_type->find("TestService"), std::string::npos);
  EXPECT_EQ(snapshot.containers[1].namespace_scope, "B");
  EXPECT_EQ(snapshot.containers[1].registrations, 1u);
  EXPECT_FALSE(snapshot.containers[1].disposed);
}
