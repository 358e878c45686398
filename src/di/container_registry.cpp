#include "strata/di/container_registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "strata/util/logging.hpp"

namespace strata::di {

ContainerRegistry& ContainerRegistry::instance() {
    // Containers still registered at exit are disposed while the registry is
    // destroyed and may log; the logger is created first so it is destroyed last.
    [[maybe_unused]] static const bool logger_ready = (util::logger(), true);
    static ContainerRegistry instance_;
    return instance_;
}

ContainerRegistry::~ContainerRegistry() {
    // Containers released here may call back into unregisterContainer; keep every member alive
    std::unordered_map<const IServiceContainer*, ContainerRegistrationPtr> containers;
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        containers.swap(containers_);
        namespace_index_.clear();
        owner_index_.clear();

        invalidateChainCache();
        updateSingleContainer();
    }
}

void ContainerRegistry::registerContainer(std::shared_ptr<IServiceContainer> container,
                                          std::optional<std::string> namespace_scope,
                                          std::optional<ObjectIdentity> scope_owner) {
    if (!container) {
        throw ServiceResolutionException(ErrorCode::kInvalidArgument, "Container cannot be null");
    }

    if (namespace_scope) {
        validateNamespaceScope(*namespace_scope);
    }

    auto registration = std::make_shared<const ContainerRegistration>(
        ContainerRegistration{container, namespace_scope, scope_owner});

    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);

        if (containers_.count(container.get()) != 0) {
            throw ServiceResolutionException(ErrorCode::kDuplicateRegistration,
                                             "Container is already registered.");
        }

        if (namespace_scope && namespace_index_.count(*namespace_scope) != 0) {
            throw ServiceResolutionException(
                ErrorCode::kDuplicateRegistration,
                "A container with namespace scope '" + *namespace_scope + "' is already registered.");
        }

        if (scope_owner && owner_index_.count(*scope_owner) != 0) {
            throw ServiceResolutionException(
                ErrorCode::kDuplicateRegistration,
                "A container with scope owner '" + scope_owner->typeName() +
                    "' is already registered.");
        }

        containers_.emplace(container.get(), registration);
        if (namespace_scope) {
            namespace_index_.emplace(*namespace_scope, registration);
        }
        if (scope_owner) {
            owner_index_.emplace(*scope_owner, registration);
        }

        invalidateChainCache();
        updateSingleContainer();
    }

    util::logger()->debug("Registered container{}{}",
                          namespace_scope ? " for namespace '" + *namespace_scope + "'" : "",
                          scope_owner ? " for owner '" + scope_owner->typeName() + "'" : "");
}

void ContainerRegistry::unregisterContainer(const IServiceContainer* container) {
    if (container == nullptr) {
        return;
    }

    // Released after the lock; it may hold the last reference to the container
    ContainerRegistrationPtr removed;
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);

        auto it = containers_.find(container);
        if (it == containers_.end()) {
            return;
        }

        removed = std::move(it->second);
        containers_.erase(it);

        if (removed->namespace_scope) {
            namespace_index_.erase(*removed->namespace_scope);
        }
        if (removed->scope_owner) {
            owner_index_.erase(*removed->scope_owner);
        }

        invalidateChainCache();
        updateSingleContainer();
    }

    util::logger()->debug("Unregistered container{}",
                          removed->namespace_scope
                              ? " for namespace '" + *removed->namespace_scope + "'"
                              : "");
}

ScopeHandle ContainerRegistry::beginScope(std::string_view namespace_scope) {
    validateNamespaceScope(namespace_scope);
    return ScopeController::pushNamespace(std::string(namespace_scope));
}

ScopeHandle ContainerRegistry::beginScope(const ObjectIdentity& scope_owner) {
    return ScopeController::pushObject(scope_owner);
}

void ContainerRegistry::dispose() {
    std::unordered_map<const IServiceContainer*, ContainerRegistrationPtr> containers;
    std::unordered_map<std::string, ContainerRegistrationPtr> namespace_index;
    std::unordered_map<ObjectIdentity, ContainerRegistrationPtr, ObjectIdentityHash> owner_index;
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        containers.swap(containers_);
        namespace_index.swap(namespace_index_);
        owner_index.swap(owner_index_);

        invalidateChainCache();
        updateSingleContainer();
    }

    ScopeController::resetAll();

    util::logger()->info("Container registry reset ({} containers released)", containers.size());
}

std::size_t ContainerRegistry::containerCount() const {
    return container_count_.load(std::memory_order_acquire);
}

RegistrySnapshot ContainerRegistry::snapshot() const {
    RegistrySnapshot result;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        result.containers.reserve(containers_.size());
        for (const auto& [key, registration] : containers_) {
            RegistrySnapshot::Entry entry;
            entry.namespace_scope = registration->namespace_scope;
            if (registration->scope_owner) {
                entry.scope_owner_type = registration->scope_owner->typeName();
            }
            entry.registrations = registration->container->registrationCount();
            entry.disposed = registration->container->isDisposed();
            result.containers.push_back(std::move(entry));
        }
    }

    std::sort(result.containers.begin(), result.containers.end(),
              [](const RegistrySnapshot::Entry& a, const RegistrySnapshot::Entry& b) {
                  return a.namespace_scope.value_or("") < b.namespace_scope.value_or("");
              });

    {
        std::lock_guard<std::mutex> lock(chain_cache_mutex_);
        result.cached_chains = chain_cache_.size();
    }

    {
        std::lock_guard<std::mutex> lock(single_mutex_);
        result.single_container_fast_path = single_container_ != nullptr;
    }

    result.ambient_depth = ScopeController::depth();
    return result;
}

ContainerRegistrationPtr ContainerRegistry::singleContainer() const {
    if (container_count_.load(std::memory_order_acquire) != 1) {
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(single_mutex_);
        if (single_container_ && container_count_.load(std::memory_order_relaxed) == 1) {
            return single_container_;
        }
    }

    // Fast path not trusted; take the flat index as the source of truth
    util::logger()->trace("Single-container fast path missed; using flat index");
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    if (containers_.size() == 1) {
        return containers_.begin()->second;
    }
    return nullptr;
}

std::shared_ptr<const NamespaceChain> ContainerRegistry::namespaceChain(std::string_view namespace_scope) {
    std::string key(namespace_scope);
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(chain_cache_mutex_);
        auto it = chain_cache_.find(key);
        if (it != chain_cache_.end()) {
            return it->second;
        }
        generation = chain_generation_;
    }

    auto chain = std::make_shared<const NamespaceChain>(buildNamespaceChain(namespace_scope));

    {
        std::lock_guard<std::mutex> lock(chain_cache_mutex_);
        // A mutation since the miss may have made this chain stale; use it once, do not cache it
        if (chain_generation_ == generation) {
            chain_cache_.emplace(std::move(key), chain);
        }
    }

    return chain;
}

NamespaceChain ContainerRegistry::buildNamespaceChain(std::string_view namespace_scope) const {
    NamespaceChain chain;
    std::string current(namespace_scope);

    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    while (true) {
        auto it = namespace_index_.find(current);
        if (it != namespace_index_.end()) {
            chain.push_back(it->second);
        }

        auto last_dot = current.rfind('.');
        if (last_dot == std::string::npos) {
            break;
        }
        current.resize(last_dot);
    }

    return chain;
}

ContainerRegistrationPtr ContainerRegistry::findByOwner(const ObjectIdentity& scope_owner) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = owner_index_.find(scope_owner);
    if (it == owner_index_.end()) {
        return nullptr;
    }
    return it->second;
}

void ContainerRegistry::invalidateChainCache() {
    std::lock_guard<std::mutex> lock(chain_cache_mutex_);
    chain_cache_.clear();
    ++chain_generation_;
}

void ContainerRegistry::updateSingleContainer() {
    std::lock_guard<std::mutex> lock(single_mutex_);
    container_count_.store(containers_.size(), std::memory_order_release);
    if (containers_.size() == 1) {
        single_container_ = containers_.begin()->second;
    } else {
        single_container_.reset();
    }
}

void ContainerRegistry::validateNamespaceScope(std::string_view namespace_scope) {
    if (!namespace_scope.empty() &&
        std::all_of(namespace_scope.begin(), namespace_scope.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        throw ServiceResolutionException(ErrorCode::kInvalidArgument,
                                         "Scope cannot be whitespace.");
    }
}

void ContainerRegistry::requireContainer(const IServiceContainer* container) {
    if (container == nullptr) {
        throw ServiceResolutionException(ErrorCode::kInvalidArgument, "Container cannot be null");
    }
}

void ContainerRegistry::throwNoScope(const std::string& type_name) const {
    throw ServiceResolutionException(
        ErrorCode::kAmbiguousScope,
        "Multiple containers are registered but no scope is set for " + type_name +
            ". Use ContainerRegistry::beginScope(...) or resolve<T>(scope).");
}

void ContainerRegistry::throwNoNamespaceContainer(std::string_view namespace_scope) const {
    throw ServiceResolutionException(
        ErrorCode::kAmbiguousScope,
        "No container registered for namespace scope '" + std::string(namespace_scope) +
            "' and more than one container is registered.");
}

} // namespace strata::di
