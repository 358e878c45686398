#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "strata/di/object_identity.hpp"
#include "strata/di/scope_controller.hpp"
#include "strata/di/service_container.hpp"
#include "strata/di/service_error.hpp"

namespace strata::di {

/**
 * @brief A container as known to the registry, with its optional scopes
 */
struct ContainerRegistration {
    std::shared_ptr<IServiceContainer> container;
    std::optional<std::string> namespace_scope;
    std::optional<ObjectIdentity> scope_owner;
};

using ContainerRegistrationPtr = std::shared_ptr<const ContainerRegistration>;

// Containers bound to a namespace and its ancestors, most specific first
using NamespaceChain = std::vector<ContainerRegistrationPtr>;

/**
 * @brief Point-in-time view of the registry for diagnostics
 */
struct RegistrySnapshot {
    struct Entry {
        std::optional<std::string> namespace_scope;
        std::optional<std::string> scope_owner_type;
        std::size_t registrations = 0;
        bool disposed = false;
    };

    std::vector<Entry> containers;
    std::size_t cached_chains = 0;
    bool single_container_fast_path = false;
    std::size_t ambient_depth = 0;
};

/**
 * @brief Process-wide registry of live containers.
 *
 * Picks the container a resolution goes to: the calling thread's ambient
 * scope, an explicit namespace scope (searched from the most specific
 * ancestor outwards), an explicit scope owner, or the only registered
 * container. Resolution through the registry is meant for generated code
 * and critical paths; constructor injection is preferred everywhere else.
 */
class ContainerRegistry {
public:
    static ContainerRegistry& instance();

    ~ContainerRegistry();

    ContainerRegistry(const ContainerRegistry&) = delete;
    ContainerRegistry& operator=(const ContainerRegistry&) = delete;

    /**
     * @brief Register a container, optionally bound to a namespace scope and/or scope owner
     * @throws ServiceResolutionException kInvalidArgument for a null container or a
     *         whitespace-only scope, kDuplicateRegistration when the container, scope or
     *         owner is already bound
     */
    void registerContainer(std::shared_ptr<IServiceContainer> container,
                           std::optional<std::string> namespace_scope = std::nullopt,
                           std::optional<ObjectIdentity> scope_owner = std::nullopt);

    // No-op for containers the registry does not know
    void unregisterContainer(const IServiceContainer* container);

    /**
     * @brief Resolve from the ambient scope, or from the only registered container
     * @throws ServiceResolutionException kNotRegistered, kAmbiguousScope, or any
     *         failure raised by the chosen container
     */
    template<typename T>
    std::shared_ptr<T> resolve() {
        std::shared_ptr<T> instance;
        if (!lookupAmbient(instance)) {
            throw ServiceResolutionException(
                ErrorCode::kNotRegistered,
                "Service of type " + typeName(typeid(T)) + " is not registered.");
        }
        return instance;
    }

    /**
     * @brief Resolve from the container bound to the closest enclosing namespace scope
     */
    template<typename T>
    std::shared_ptr<T> resolve(std::string_view namespace_scope) {
        std::shared_ptr<T> instance;
        if (!lookupInNamespace(namespace_scope, instance)) {
            throw ServiceResolutionException(
                ErrorCode::kNotRegistered,
                "Service of type " + typeName(typeid(T)) + " is not registered for scope '" +
                    std::string(namespace_scope) + "'.");
        }
        return instance;
    }

    /**
     * @brief Resolve from the container bound to the given scope owner
     */
    template<typename T>
    std::shared_ptr<T> resolve(const ObjectIdentity& scope_owner) {
        std::shared_ptr<T> instance;
        if (!lookupForOwner(scope_owner, instance)) {
            throw ServiceResolutionException(
                ErrorCode::kNotRegistered,
                "Service of type " + typeName(typeid(T)) + " is not registered for scope owner '" +
                    scope_owner.typeName() + "'.");
        }
        return instance;
    }

    /**
     * @brief resolve<T>() that returns false when no container in reach registers T.
     *
     * Failures raised while building a registered T, a missing dependency of
     * its factory included, still propagate.
     */
    template<typename T>
    bool tryResolve(std::shared_ptr<T>& out) {
        if (lookupAmbient(out)) {
            return true;
        }
        out.reset();
        return false;
    }

    /**
     * @brief Resolve directly from a container the caller already holds
     */
    template<typename T>
    static std::shared_ptr<T> resolveFrom(IServiceContainer* container) {
        requireContainer(container);
        return container->resolve<T>();
    }

    template<typename T>
    static bool tryResolveFrom(IServiceContainer* container, std::shared_ptr<T>& out) {
        requireContainer(container);
        return container->tryResolve<T>(out);
    }

    /**
     * @brief Open an ambient scope on the calling thread
     */
    [[nodiscard]] ScopeHandle beginScope(std::string_view namespace_scope);
    [[nodiscard]] ScopeHandle beginScope(const ObjectIdentity& scope_owner);

    /**
     * @brief Forget every container and cached chain and discard ambient scopes.
     *
     * Containers are not disposed and keep working when used directly. A container
     * that only the registry still referenced is destroyed, which disposes it.
     */
    void dispose();

    std::size_t containerCount() const;
    RegistrySnapshot snapshot() const;

private:
    ContainerRegistry() = default;

    ContainerRegistrationPtr singleContainer() const;
    std::shared_ptr<const NamespaceChain> namespaceChain(std::string_view namespace_scope);
    NamespaceChain buildNamespaceChain(std::string_view namespace_scope) const;
    ContainerRegistrationPtr findByOwner(const ObjectIdentity& scope_owner) const;

    // Callers hold index_mutex_ exclusively
    void invalidateChainCache();
    void updateSingleContainer();

    static void validateNamespaceScope(std::string_view namespace_scope);
    static void requireContainer(const IServiceContainer* container);
    [[noreturn]] void throwNoScope(const std::string& type_name) const;
    [[noreturn]] void throwNoNamespaceContainer(std::string_view namespace_scope) const;

    // The lookups return false only when no container in reach registers T

    template<typename T>
    bool lookupAmbient(std::shared_ptr<T>& out) {
        if (auto frame = ScopeController::current()) {
            switch (frame->kind()) {
                case ScopeKind::kNamespace:
                    return lookupInNamespace(frame->namespaceScope(), out);
                case ScopeKind::kObject:
                    return lookupForOwner(frame->scopeOwner(), out);
            }
        }

        if (auto single = singleContainer()) {
            return single->container->tryResolve<T>(out);
        }
        if (containerCount() == 0) {
            return false;
        }
        throwNoScope(typeName(typeid(T)));
    }

    template<typename T>
    bool lookupInNamespace(std::string_view namespace_scope, std::shared_ptr<T>& out) {
        validateNamespaceScope(namespace_scope);
        auto chain = namespaceChain(namespace_scope);

        if (chain->empty()) {
            if (auto single = singleContainer()) {
                return single->container->tryResolve<T>(out);
            }
            if (containerCount() == 0) {
                return false;
            }
            throwNoNamespaceContainer(namespace_scope);
        }

        for (const auto& registration : *chain) {
            if (registration->container->tryResolve<T>(out)) {
                return true;
            }
        }
        return false;
    }

    template<typename T>
    bool lookupForOwner(const ObjectIdentity& scope_owner, std::shared_ptr<T>& out) {
        auto registration = findByOwner(scope_owner);
        return registration && registration->container->tryResolve<T>(out);
    }

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<const IServiceContainer*, ContainerRegistrationPtr> containers_;
    std::unordered_map<std::string, ContainerRegistrationPtr> namespace_index_;
    std::unordered_map<ObjectIdentity, ContainerRegistrationPtr, ObjectIdentityHash> owner_index_;

    mutable std::mutex chain_cache_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const NamespaceChain>> chain_cache_;
    std::uint64_t chain_generation_ = 0;

    // Count and fast-path value change together under single_mutex_
    mutable std::mutex single_mutex_;
    std::atomic<std::size_t> container_count_{0};
    ContainerRegistrationPtr single_container_;
};

} // namespace strata::di
