#include "strata/di/registry_report.hpp"

#include <sstream>

#include "strata/common.hpp"

namespace strata::di {

namespace {

template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

nlohmann::json describeRegistry(const RegistrySnapshot& snapshot) {
    nlohmann::json report;

    nlohmann::json containers = nlohmann::json::array();
    for (const auto& entry : snapshot.containers) {
        containers.push_back({
            {"namespace", optionalToJson(entry.namespace_scope)},
            {"owner", optionalToJson(entry.scope_owner_type)},
            {"registrations", entry.registrations},
            {"disposed", entry.disposed}
        });
    }

    report["containers"] = containers;
    report["container_count"] = snapshot.containers.size();
    report["cached_chains"] = snapshot.cached_chains;
    report["single_container_fast_path"] = snapshot.single_container_fast_path;
    report["ambient_depth"] = snapshot.ambient_depth;
    return report;
}

std::string formatRegistry(const RegistrySnapshot& snapshot) {
    std::ostringstream oss;
    oss << snapshot.containers.size() << " container(s), " << snapshot.cached_chains
        << " cached chain(s), ambient depth " << snapshot.ambient_depth;
    if (snapshot.single_container_fast_path) {
        oss << ", single-container fast path";
    }
    oss << '\n';

    for (const auto& entry : snapshot.containers) {
        oss << "  - ";
        if (entry.namespace_scope) {
            oss << "namespace '" << *entry.namespace_scope << "'";
        } else if (entry.scope_owner_type) {
            oss << "owner " << *entry.scope_owner_type;
        } else {
            oss << "(unscoped)";
        }
        if (entry.namespace_scope && entry.scope_owner_type) {
            oss << ", owner " << *entry.scope_owner_type;
        }
        oss << ": " << entry.registrations << " registration(s)";
        if (entry.disposed) {
            oss << " [disposed]";
        }
        oss << '\n';
    }

    return oss.str();
}

std::string formatError(const ServiceResolutionException& error, bool json_format) {
    if (json_format) {
        nlohmann::json error_json;
        error_json["error"] = true;
        error_json["code"] = static_cast<int>(error.code());
        error_json["name"] = std::string(errorCodeToString(error.code()));
        error_json["message"] = error.message();
        return error_json.dump();
    }

    std::ostringstream oss;
    oss << "\033[31mError\033[0m [" << errorCodeToString(error.code()) << "]: " << error.message();
    return oss.str();
}

} // namespace strata::di
