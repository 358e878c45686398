#pragma once

#include <exception>
#include <string>
#include <typeinfo>

#include "strata/common.hpp"

namespace strata::di {

/**
 * @brief Exception thrown when a registry or container operation fails
 */
class ServiceResolutionException : public std::exception {
public:
    ServiceResolutionException(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// Readable type names, demangled where the ABI allows it
std::string demangle(const char* mangled);
std::string typeName(const std::type_info& type);

} // namespace strata::di
