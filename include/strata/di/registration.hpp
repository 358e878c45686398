#pragma once

#include <functional>
#include <mutex>
#include <optional>

#include "strata/di/lifetime.hpp"
#include "strata/di/service_instance.hpp"

namespace strata::di {

class IServiceContainer;

using ServiceFactory = std::function<ServiceInstance(IServiceContainer&)>;

/**
 * @brief Factory, lifetime and cache slot for one service type in one container.
 *
 * The factory and lifetime never change after construction. The cache slot
 * is written without excluding concurrent creators: when two threads create
 * the same singleton at once, the last store wins.
 */
class Registration {
public:
    Registration(ServiceFactory factory, ServiceLifetime lifetime);

    // Pre-built singleton: the cache starts populated and the factory returns it
    explicit Registration(ServiceInstance instance);

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    ServiceLifetime lifetime() const { return lifetime_; }

    ServiceInstance create(IServiceContainer& container) const;

    std::optional<ServiceInstance> cachedInstance() const;
    void storeInstance(ServiceInstance instance);
    void clearCache();

    // Serializes first creation when the owning container runs in exclusive mode
    std::mutex& creationMutex() { return creation_mutex_; }

private:
    ServiceFactory factory_;
    ServiceLifetime lifetime_;

    mutable std::mutex cache_mutex_;
    std::optional<ServiceInstance> cached_;
    std::mutex creation_mutex_;
};

} // namespace strata::di
