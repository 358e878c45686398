#include "strata/di/container_factory.hpp"

#include <mutex>
#include <string>

#include "strata/di/container_registry.hpp"

namespace strata::di {

namespace {

std::mutex& defaultsMutex() {
    static std::mutex mutex;
    return mutex;
}

ContainerOptions& defaults() {
    static ContainerOptions options;
    return options;
}

} // namespace

std::shared_ptr<IServiceContainer> ContainerFactory::createContainer(const ContainerOptions& options) {
    return createRegistered(options, std::nullopt, std::nullopt);
}

std::shared_ptr<IServiceContainer> ContainerFactory::createScopedContainer(
    std::string_view namespace_scope, const ContainerOptions& options) {
    return createRegistered(options, std::string(namespace_scope), std::nullopt);
}

std::shared_ptr<IServiceContainer> ContainerFactory::createOwnedContainer(
    const ObjectIdentity& scope_owner, const ContainerOptions& options) {
    return createRegistered(options, std::nullopt, scope_owner);
}

std::shared_ptr<IServiceContainer> ContainerFactory::createLocalContainer(const ContainerOptions& options) {
    return std::make_shared<ServiceContainer>(options);
}

ContainerOptions ContainerFactory::defaultOptions() {
    std::lock_guard<std::mutex> lock(defaultsMutex());
    return defaults();
}

void ContainerFactory::setDefaultOptions(const ContainerOptions& options) {
    std::lock_guard<std::mutex> lock(defaultsMutex());
    defaults() = options;
}

std::shared_ptr<IServiceContainer> ContainerFactory::createRegistered(
    const ContainerOptions& options,
    std::optional<std::string> namespace_scope,
    std::optional<ObjectIdentity> scope_owner) {
    auto container = std::make_shared<ServiceContainer>(options);

    auto& registry = ContainerRegistry::instance();
    registry.registerContainer(container, std::move(namespace_scope), std::move(scope_owner));

    container->setDisposeCallback([raw = static_cast<const IServiceContainer*>(container.get())]() {
        ContainerRegistry::instance().unregisterContainer(raw);
    });

    return container;
}

} // namespace strata::di
