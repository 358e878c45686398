#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "strata/di/disposable.hpp"
#include "strata/di/lifetime.hpp"
#include "strata/di/registration.hpp"
#include "strata/di/service_error.hpp"
#include "strata/di/service_instance.hpp"

namespace strata::di {

/**
 * @brief How a container creates a lazy singleton on first resolution
 */
enum class SingletonCreation {
    kRacy,      // Concurrent first resolutions may each run the factory; last store wins
    kExclusive  // First creation is serialized per registration
};

struct ContainerOptions {
    // Dispose every Disposable instance the container produced when it is disposed
    bool dispose_registered = true;

    // Track the types being resolved on each thread and reject re-entry
#ifdef NDEBUG
    bool detect_cycles = false;
#else
    bool detect_cycles = true;
#endif

    SingletonCreation singleton_creation = SingletonCreation::kRacy;
};

/**
 * @brief Interface for service registration and resolution
 */
class IServiceContainer {
public:
    virtual ~IServiceContainer() = default;

    /**
     * @brief Register a singleton created by the factory on first resolution
     *
     * The factory returns a std::shared_ptr to T or to a type derived from T
     * and takes either no argument or the resolving container.
     */
    template<typename T, typename Factory>
    void registerAsSingletonLazy(Factory factory) {
        registerFactory(std::type_index(typeid(T)),
                        makeFactory<T>(std::move(factory)),
                        ServiceLifetime::Singleton);
    }

    /**
     * @brief Register an already created singleton instance
     */
    template<typename T>
    void registerAsSingleton(std::shared_ptr<T> instance) {
        if (!instance) {
            throw ServiceResolutionException(
                ErrorCode::kInvalidArgument,
                "Cannot register a null singleton for " + typeName(typeid(T)));
        }
        registerInstanceImpl(std::type_index(typeid(T)),
                             ServiceInstance::of<T>(std::move(instance)));
    }

    /**
     * @brief Register a service created anew on every resolution
     */
    template<typename T, typename Factory>
    void registerAsTransient(Factory factory) {
        registerFactory(std::type_index(typeid(T)),
                        makeFactory<T>(std::move(factory)),
                        ServiceLifetime::Transient);
    }

    /**
     * @brief Register a type-erased factory under an explicit key.
     *
     * The produced instance must be the requested type or derive from it;
     * this is checked at resolution time and is the only path that can
     * yield a type mismatch.
     */
    virtual void registerFactory(std::type_index type, ServiceFactory factory,
                                 ServiceLifetime lifetime) = 0;

    /**
     * @brief Resolve a service instance
     * @throws ServiceResolutionException kDisposed, kNotRegistered,
     *         kTypeMismatch or kCircularDependency
     */
    template<typename T>
    std::shared_ptr<T> resolve() {
        auto instance = resolveImpl(std::type_index(typeid(T)));
        if (!instance) {
            throw ServiceResolutionException(
                ErrorCode::kNotRegistered,
                "Service of type " + typeName(typeid(T)) + " is not registered.");
        }
        return typedView<T>(*instance);
    }

    /**
     * @brief Like resolve(), but a missing registration returns false
     */
    template<typename T>
    bool tryResolve(std::shared_ptr<T>& out) {
        auto instance = resolveImpl(std::type_index(typeid(T)));
        if (!instance) {
            out.reset();
            return false;
        }
        out = typedView<T>(*instance);
        return true;
    }

    /**
     * @brief Check if a service is registered
     */
    template<typename T>
    bool isRegistered() const {
        return isRegisteredImpl(std::type_index(typeid(T)));
    }

    virtual void dispose() = 0;
    virtual bool isDisposed() const = 0;

    // Single hook invoked once, at the end of the first dispose()
    virtual void setDisposeCallback(std::function<void()> callback) = 0;

    virtual std::size_t registrationCount() const = 0;
    virtual const ContainerOptions& options() const = 0;

protected:
    virtual void registerInstanceImpl(std::type_index type, ServiceInstance instance) = 0;

    // nullopt when the type has no registration; every other failure throws
    virtual std::optional<ServiceInstance> resolveImpl(std::type_index type) = 0;

    virtual bool isRegisteredImpl(std::type_index type) const = 0;

    [[noreturn]] static void throwTypeMismatch(const std::type_info& requested,
                                               const ServiceInstance& instance);

private:
    template<typename T>
    static std::shared_ptr<T> typedView(const ServiceInstance& instance) {
        auto typed = instance.as<T>();
        if (!typed) {
            throwTypeMismatch(typeid(T), instance);
        }
        return typed;
    }

    template<typename T, typename Factory>
    static ServiceFactory makeFactory(Factory factory) {
        static_assert(std::is_invocable_v<Factory&, IServiceContainer&> ||
                      std::is_invocable_v<Factory&>,
                      "Factory must be callable with no argument or with IServiceContainer&");

        return [factory = std::move(factory)](IServiceContainer& container) mutable {
            std::shared_ptr<T> instance;
            if constexpr (std::is_invocable_v<Factory&, IServiceContainer&>) {
                instance = factory(container);
            } else {
                instance = factory();
            }
            return ServiceInstance::of<T>(std::move(instance));
        };
    }
};

/**
 * @brief Thread-safe dependency injection container implementation.
 *
 * Disposable instances are kept alive by the container until it is disposed,
 * so transient services that hold resources live as long as their container.
 */
class ServiceContainer final : public IServiceContainer,
                               public std::enable_shared_from_this<ServiceContainer> {
public:
    explicit ServiceContainer(ContainerOptions options = {});
    ~ServiceContainer() override;

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;
    ServiceContainer(ServiceContainer&&) = delete;
    ServiceContainer& operator=(ServiceContainer&&) = delete;

    void registerFactory(std::type_index type, ServiceFactory factory,
                         ServiceLifetime lifetime) override;

    void dispose() override;
    bool isDisposed() const override;
    void setDisposeCallback(std::function<void()> callback) override;
    std::size_t registrationCount() const override;
    const ContainerOptions& options() const override { return options_; }

protected:
    void registerInstanceImpl(std::type_index type, ServiceInstance instance) override;
    std::optional<ServiceInstance> resolveImpl(std::type_index type) override;
    bool isRegisteredImpl(std::type_index type) const override;

private:
    void install(std::type_index type, std::shared_ptr<Registration> registration);
    std::shared_ptr<Registration> findRegistration(std::type_index type) const;

    ServiceInstance resolveTransient(std::type_index type, Registration& registration);
    ServiceInstance resolveSingleton(std::type_index type, Registration& registration);
    ServiceInstance createSingleton(Registration& registration);

    void verifyProduced(std::type_index requested, const ServiceInstance& instance) const;
    void trackCreated(const ServiceInstance& instance);
    void throwIfDisposed(std::type_index type) const;

    const ContainerOptions options_;

    mutable std::shared_mutex registrations_mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<Registration>> registrations_;

    std::mutex disposables_mutex_;
    std::vector<std::shared_ptr<Disposable>> disposables_;
    std::unordered_set<const Disposable*> tracked_;

    std::mutex callback_mutex_;
    std::function<void()> on_dispose_;

    std::atomic<bool> dispose_started_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace strata::di
