#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "strata/di/object_identity.hpp"
#include "strata/di/service_container.hpp"

namespace strata::di {

/**
 * @brief Creates containers and wires them into the global registry.
 *
 * Every registered container unregisters itself when it is disposed.
 */
class ContainerFactory {
public:
    /**
     * @brief Create a container resolvable through the registry without a scope
     */
    static std::shared_ptr<IServiceContainer> createContainer(
        const ContainerOptions& options = defaultOptions());

    /**
     * @brief Create a container bound to a namespace scope such as "App.UI"
     * @throws ServiceResolutionException kDuplicateRegistration if the scope is taken
     */
    static std::shared_ptr<IServiceContainer> createScopedContainer(
        std::string_view namespace_scope,
        const ContainerOptions& options = defaultOptions());

    /**
     * @brief Create a container bound to the identity of a scope-owner object
     * @throws ServiceResolutionException kDuplicateRegistration if the owner is taken
     */
    static std::shared_ptr<IServiceContainer> createOwnedContainer(
        const ObjectIdentity& scope_owner,
        const ContainerOptions& options = defaultOptions());

    /**
     * @brief Create a container the registry never sees
     */
    static std::shared_ptr<IServiceContainer> createLocalContainer(
        const ContainerOptions& options = defaultOptions());

    static ContainerOptions defaultOptions();
    static void setDefaultOptions(const ContainerOptions& options);

private:
    static std::shared_ptr<IServiceContainer> createRegistered(
        const ContainerOptions& options,
        std::optional<std::string> namespace_scope,
        std::optional<ObjectIdentity> scope_owner);
};

} // namespace strata::di
