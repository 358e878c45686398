#pragma once

#include <any>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>

#include "strata/di/disposable.hpp"
#include "strata/di/service_error.hpp"

namespace strata::di {

/**
 * @brief Type-erased instance produced by a registration.
 *
 * Holds the instance as a std::shared_ptr<T> for the type it was produced
 * as. Retrieval succeeds for that type and for any unambiguous public base
 * of it; every other type yields nullptr instead of reinterpreting memory.
 * The Disposable view is captured at construction, while the static type
 * is still known.
 */
class ServiceInstance {
public:
    ServiceInstance() : type_(typeid(void)) {}

    template<typename T>
    static ServiceInstance of(std::shared_ptr<T> value) {
        ServiceInstance instance;
        instance.type_ = std::type_index(typeid(T));
        instance.address_ = static_cast<const void*>(value.get());
        instance.disposable_ = asDisposable(value);
        instance.throw_pointer_ = &throwPointer<T>;
        instance.owner_ = value;
        instance.value_ = std::move(value);
        return instance;
    }

    /**
     * @brief Typed view of the instance, or nullptr if T is neither the
     * produced type nor one of its bases
     */
    template<typename T>
    std::shared_ptr<T> as() const {
        if (const auto* typed = std::any_cast<std::shared_ptr<T>>(&value_)) {
            return *typed;
        }
        if (empty()) {
            return nullptr;
        }
        return upcast<T>();
    }

    bool empty() const { return address_ == nullptr; }
    const void* address() const { return address_; }
    std::type_index type() const { return type_; }
    std::string typeName() const;
    const std::shared_ptr<Disposable>& disposable() const { return disposable_; }

private:
    // The handler for T* matches the thrown pointer exactly when the produced
    // type converts to T, which resolves bases the static type cannot name.
    template<typename T>
    std::shared_ptr<T> upcast() const {
        try {
            throw_pointer_(address_);
        } catch (T* base) {
            return std::shared_ptr<T>(owner_, base);
        } catch (const volatile void*) {
            // T is not an accessible, unambiguous base
        }
        return nullptr;
    }

    template<typename T>
    static void throwPointer(const void* address) {
        throw const_cast<T*>(static_cast<const T*>(address));
    }

    template<typename T>
    static std::shared_ptr<Disposable> asDisposable(const std::shared_ptr<T>& value) {
        if constexpr (std::is_base_of_v<Disposable, T>) {
            return std::static_pointer_cast<Disposable>(value);
        } else if constexpr (std::is_polymorphic_v<T>) {
            return std::dynamic_pointer_cast<Disposable>(value);
        } else {
            return nullptr;
        }
    }

    std::any value_;
    std::type_index type_;
    const void* address_ = nullptr;
    std::shared_ptr<const void> owner_;
    void (*throw_pointer_)(const void*) = nullptr;
    std::shared_ptr<Disposable> disposable_;
};

} // namespace strata::di
