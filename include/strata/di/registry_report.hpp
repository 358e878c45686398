#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "strata/di/container_registry.hpp"
#include "strata/di/service_error.hpp"

namespace strata::di {

/**
 * @brief Render a registry snapshot as JSON
 *
 * Layout: {"containers": [{"namespace", "owner", "registrations", "disposed"}],
 * "container_count", "cached_chains", "single_container_fast_path", "ambient_depth"}.
 * Absent scopes are null.
 */
nlohmann::json describeRegistry(const RegistrySnapshot& snapshot);

// Plain-text variant of describeRegistry, one line per container
std::string formatRegistry(const RegistrySnapshot& snapshot);

/**
 * @brief Format a resolution failure for users
 * @param json_format JSON object with error/code/name/message when true, one line otherwise
 */
std::string formatError(const ServiceResolutionException& error, bool json_format);

} // namespace strata::di
