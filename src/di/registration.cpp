#include "strata/di/registration.hpp"

#include <utility>

namespace strata::di {

Registration::Registration(ServiceFactory factory, ServiceLifetime lifetime)
    : factory_(std::move(factory)), lifetime_(lifetime) {
    if (!factory_) {
        throw ServiceResolutionException(ErrorCode::kInvalidArgument,
                                         "Registration requires a factory");
    }
}

Registration::Registration(ServiceInstance instance)
    : lifetime_(ServiceLifetime::Singleton), cached_(instance) {
    factory_ = [instance = std::move(instance)](IServiceContainer&) { return instance; };
}

ServiceInstance Registration::create(IServiceContainer& container) const {
    return factory_(container);
}

std::optional<ServiceInstance> Registration::cachedInstance() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cached_;
}

void Registration::storeInstance(ServiceInstance instance) {
    if (lifetime_ != ServiceLifetime::Singleton) {
        return;
    }
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cached_ = std::move(instance);
}

void Registration::clearCache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cached_.reset();
}

} // namespace strata::di
