#include "strata/di/service_error.hpp"
#include "strata/di/service_instance.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace strata::di {

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return mangled;
}

std::string typeName(const std::type_info& type) {
    return demangle(type.name());
}

std::string ServiceInstance::typeName() const {
    return demangle(type_.name());
}

} // namespace strata::di
