#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>

#include "strata/di/service_error.hpp"

namespace strata::di {

/**
 * @brief Address identity of a scope-owner object.
 *
 * Two identities are equal only when they denote the same object; the
 * object's value is never compared. An identity is keyed by address and
 * type, so an object and its first member stay distinct. Polymorphic
 * objects use their most-derived address and dynamic type, so every
 * base-class view yields the same identity; a base view of a
 * non-polymorphic object is a different identity. The identity does not
 * extend the object's lifetime.
 */
class ObjectIdentity {
public:
    template<typename T>
    static ObjectIdentity of(const T& object) {
        if constexpr (std::is_polymorphic_v<T>) {
            return ObjectIdentity(dynamic_cast<const void*>(&object), typeid(object));
        } else {
            return ObjectIdentity(static_cast<const void*>(std::addressof(object)), typeid(T));
        }
    }

    template<typename T>
    static ObjectIdentity of(const std::shared_ptr<T>& object) {
        if (!object) {
            throw ServiceResolutionException(ErrorCode::kInvalidArgument,
                                             "Scope owner cannot be null");
        }
        return of(*object);
    }

    const void* address() const { return address_; }
    std::string typeName() const { return strata::di::typeName(*type_); }

    bool operator==(const ObjectIdentity& other) const {
        return address_ == other.address_ && *type_ == *other.type_;
    }
    bool operator!=(const ObjectIdentity& other) const { return !(*this == other); }

private:
    ObjectIdentity(const void* address, const std::type_info& type)
        : address_(address), type_(&type) {}

    const void* address_;
    const std::type_info* type_;
};

struct ObjectIdentityHash {
    std::size_t operator()(const ObjectIdentity& identity) const noexcept {
        return std::hash<const void*>{}(identity.address());
    }
};

} // namespace strata::di
