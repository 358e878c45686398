#include "strata/di/service_container.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

#include "strata/util/logging.hpp"

namespace strata::di {

namespace {

struct ResolutionEntry {
    const IServiceContainer* container;
    std::type_index type;
};

// Types currently being resolved on this thread, innermost last
thread_local std::vector<ResolutionEntry> resolution_stack;

class ResolutionGuard {
public:
    ResolutionGuard(const IServiceContainer* container, std::type_index type) {
        auto it = std::find_if(resolution_stack.begin(), resolution_stack.end(),
                               [&](const ResolutionEntry& entry) {
                                   return entry.container == container && entry.type == type;
                               });
        if (it != resolution_stack.end()) {
            std::ostringstream chain;
            for (; it != resolution_stack.end(); ++it) {
                chain << demangle(it->type.name()) << " -> ";
            }
            chain << demangle(type.name());
            throw ServiceResolutionException(
                ErrorCode::kCircularDependency,
                "Circular dependency detected while resolving " + demangle(type.name()) +
                    " [" + chain.str() + "]");
        }
        resolution_stack.push_back(ResolutionEntry{container, type});
    }

    ~ResolutionGuard() {
        if (!resolution_stack.empty()) {
            resolution_stack.pop_back();
        }
    }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;
};

} // namespace

ServiceContainer::ServiceContainer(ContainerOptions options)
    : options_(options) {}

ServiceContainer::~ServiceContainer() {
    try {
        dispose();
    } catch (const std::exception& e) {
        util::logger()->error("Service disposal failed while destroying container: {}", e.what());
    } catch (...) {
        util::logger()->error("Service disposal failed while destroying container: unknown exception");
    }
}

void ServiceContainer::registerFactory(std::type_index type, ServiceFactory factory,
                                       ServiceLifetime lifetime) {
    install(type, std::make_shared<Registration>(std::move(factory), lifetime));
}

void ServiceContainer::registerInstanceImpl(std::type_index type, ServiceInstance instance) {
    throwIfDisposed(type);
    install(type, std::make_shared<Registration>(instance));
    trackCreated(instance);
}

void ServiceContainer::install(std::type_index type, std::shared_ptr<Registration> registration) {
    throwIfDisposed(type);

    // The replaced registration is released outside the lock
    std::shared_ptr<Registration> previous;
    {
        std::unique_lock<std::shared_mutex> lock(registrations_mutex_);
        auto& slot = registrations_[type];
        previous = std::exchange(slot, std::move(registration));
    }
}

std::shared_ptr<Registration> ServiceContainer::findRegistration(std::type_index type) const {
    std::shared_lock<std::shared_mutex> lock(registrations_mutex_);
    auto it = registrations_.find(type);
    if (it == registrations_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ServiceContainer::isRegisteredImpl(std::type_index type) const {
    return findRegistration(type) != nullptr;
}

std::size_t ServiceContainer::registrationCount() const {
    std::shared_lock<std::shared_mutex> lock(registrations_mutex_);
    return registrations_.size();
}

std::optional<ServiceInstance> ServiceContainer::resolveImpl(std::type_index type) {
    throwIfDisposed(type);

    std::optional<ResolutionGuard> guard;
    if (options_.detect_cycles) {
        guard.emplace(this, type);
    }

    auto registration = findRegistration(type);
    if (!registration) {
        return std::nullopt;
    }

    switch (registration->lifetime()) {
        case ServiceLifetime::Transient:
            return resolveTransient(type, *registration);
        case ServiceLifetime::Singleton:
            return resolveSingleton(type, *registration);
    }

    throw ServiceResolutionException(ErrorCode::kUnknownError,
                                     "Unknown lifetime for " + demangle(type.name()));
}

ServiceInstance ServiceContainer::resolveTransient(std::type_index type, Registration& registration) {
    auto instance = registration.create(*this);
    verifyProduced(type, instance);
    trackCreated(instance);
    return instance;
}

ServiceInstance ServiceContainer::resolveSingleton(std::type_index type, Registration& registration) {
    auto cached = registration.cachedInstance();

    if (!cached) {
        if (options_.singleton_creation == SingletonCreation::kExclusive) {
            std::lock_guard<std::mutex> lock(registration.creationMutex());
            cached = registration.cachedInstance();
            if (!cached) {
                cached = createSingleton(registration);
            }
        } else {
            cached = createSingleton(registration);
        }
    }

    verifyProduced(type, *cached);
    return *cached;
}

ServiceInstance ServiceContainer::createSingleton(Registration& registration) {
    auto created = registration.create(*this);
    if (created.empty()) {
        // Leave the slot empty so the next resolution retries the factory
        return created;
    }

    registration.storeInstance(created);
    trackCreated(created);

    // Another thread may have stored its own instance in the meantime
    return registration.cachedInstance().value_or(created);
}

// Whether the product converts to the requested type is decided by the typed
// resolve, which still knows the requested static type.
void ServiceContainer::verifyProduced(std::type_index requested, const ServiceInstance& instance) const {
    if (instance.empty()) {
        throw ServiceResolutionException(
            ErrorCode::kTypeMismatch,
            "Factory for " + demangle(requested.name()) + " produced no instance.");
    }
}

void IServiceContainer::throwTypeMismatch(const std::type_info& requested,
                                          const ServiceInstance& instance) {
    throw ServiceResolutionException(
        ErrorCode::kTypeMismatch,
        "Dependency type mismatch. You tried to resolve dependency as type " +
            typeName(requested) + " but created dependency is of type " +
            instance.typeName() +
            ". Maybe you forgot to register it or registered it with a different type.");
}

void ServiceContainer::trackCreated(const ServiceInstance& instance) {
    if (!options_.dispose_registered) {
        return;
    }

    const auto& disposable = instance.disposable();
    if (!disposable) {
        return;
    }

    std::lock_guard<std::mutex> lock(disposables_mutex_);
    if (tracked_.insert(disposable.get()).second) {
        disposables_.push_back(disposable);
    }
}

void ServiceContainer::throwIfDisposed(std::type_index type) const {
    if (disposed_.load(std::memory_order_acquire)) {
        throw ServiceResolutionException(
            ErrorCode::kDisposed,
            "Cannot use a disposed container (requested " + demangle(type.name()) + ").");
    }
}

bool ServiceContainer::isDisposed() const {
    return disposed_.load(std::memory_order_acquire);
}

void ServiceContainer::setDisposeCallback(std::function<void()> callback) {
    if (disposed_.load(std::memory_order_acquire)) {
        throw ServiceResolutionException(
            ErrorCode::kDisposed,
            "Cannot subscribe to dispose callback on a disposed container.");
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_dispose_ = std::move(callback);
}

void ServiceContainer::dispose() {
    if (dispose_started_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // The dispose callback may drop the last external owner of this container
    auto self = weak_from_this().lock();

    std::exception_ptr first_failure;

    if (options_.dispose_registered) {
        std::vector<std::shared_ptr<Disposable>> disposables;
        {
            std::lock_guard<std::mutex> lock(disposables_mutex_);
            disposables.swap(disposables_);
            tracked_.clear();
        }

        for (const auto& disposable : disposables) {
            try {
                disposable->dispose();
            } catch (const std::exception& e) {
                util::logger()->error("Failed to dispose service instance: {}", e.what());
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            } catch (...) {
                util::logger()->error("Failed to dispose service instance: unknown exception");
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
    }

    std::unordered_map<std::type_index, std::shared_ptr<Registration>> registrations;
    {
        std::unique_lock<std::shared_mutex> lock(registrations_mutex_);
        registrations.swap(registrations_);
    }

    disposed_.store(true, std::memory_order_release);

    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = std::move(on_dispose_);
        on_dispose_ = nullptr;
    }

    if (callback) {
        callback();
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

} // namespace strata::di
