#include "strata/di/lifetime.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace strata::di {

std::string_view lifetimeToString(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::Transient:
            return "transient";
        case ServiceLifetime::Singleton:
            return "singleton";
    }
    return "unknown";
}

std::optional<ServiceLifetime> parseLifetime(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "transient") {
        return ServiceLifetime::Transient;
    }
    if (lowered == "singleton") {
        return ServiceLifetime::Singleton;
    }
    return std::nullopt;
}

} // namespace strata::di
