#pragma once

#include <optional>
#include <string_view>

namespace strata::di {

/**
 * @brief Service lifetime options
 */
enum class ServiceLifetime {
    Transient,  // New instance created each time
    Singleton   // Single instance per container, created on first resolution
};

std::string_view lifetimeToString(ServiceLifetime lifetime);

// Case-insensitive; accepts "transient" and "singleton"
std::optional<ServiceLifetime> parseLifetime(std::string_view text);

} // namespace strata::di
