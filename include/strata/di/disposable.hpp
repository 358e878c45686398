#pragma once

namespace strata::di {

/**
 * @brief Capability implemented by services that hold resources.
 *
 * A container that owns disposal calls dispose() on every instance it
 * produced (or was handed) that implements this interface, in creation order.
 */
class Disposable {
public:
    virtual ~Disposable() = default;
    virtual void dispose() = 0;
};

} // namespace strata::di
