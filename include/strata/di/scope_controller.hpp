#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "strata/di/object_identity.hpp"

namespace strata::di {

enum class ScopeKind {
    kNamespace,
    kObject
};

/**
 * @brief One entry of a thread's ambient scope stack
 */
class ScopeFrame {
public:
    ScopeFrame(std::string namespace_scope, std::shared_ptr<const ScopeFrame> previous,
               std::uint64_t epoch);
    ScopeFrame(ObjectIdentity scope_owner, std::shared_ptr<const ScopeFrame> previous,
               std::uint64_t epoch);

    ScopeKind kind() const { return kind_; }

    // Valid for kNamespace frames
    const std::string& namespaceScope() const { return namespace_scope_; }

    // Valid for kObject frames
    const ObjectIdentity& scopeOwner() const { return *scope_owner_; }

    const std::shared_ptr<const ScopeFrame>& previous() const { return previous_; }
    std::uint64_t epoch() const { return epoch_; }

private:
    ScopeKind kind_;
    std::string namespace_scope_;
    std::optional<ObjectIdentity> scope_owner_;
    std::shared_ptr<const ScopeFrame> previous_;
    std::uint64_t epoch_;
};

/**
 * @brief Releasable handle bound to exactly one ambient scope frame.
 *
 * Handles must be released in reverse order of creation on the thread that
 * opened them. release() reports a violation by throwing; a violation
 * discovered by the destructor terminates the process.
 */
class ScopeHandle {
public:
    ScopeHandle() = default;
    explicit ScopeHandle(std::shared_ptr<const ScopeFrame> frame);
    ~ScopeHandle();

    ScopeHandle(const ScopeHandle&) = delete;
    ScopeHandle& operator=(const ScopeHandle&) = delete;

    ScopeHandle(ScopeHandle&& other) noexcept;
    ScopeHandle& operator=(ScopeHandle&& other);

    /**
     * @brief Pop the frame if it is the top of the calling thread's stack
     * @throws ServiceResolutionException kOutOfOrderScopeDispose otherwise
     */
    void release();

    bool active() const { return frame_ != nullptr; }
    const ScopeFrame* frame() const { return frame_.get(); }

private:
    std::shared_ptr<const ScopeFrame> frame_;
};

/**
 * @brief Per-thread stack of ambient scopes.
 *
 * Frames pushed on one thread are invisible to every other thread.
 * resetAll() invalidates the stacks of every thread: each thread drops its
 * stack the next time it touches ambient scope.
 */
class ScopeController {
public:
    [[nodiscard]] static ScopeHandle pushNamespace(std::string namespace_scope);
    [[nodiscard]] static ScopeHandle pushObject(const ObjectIdentity& scope_owner);

    // Innermost frame of the calling thread, or nullptr
    static std::shared_ptr<const ScopeFrame> current();

    static std::size_t depth();

    // Discard the ambient stacks of all threads
    static void resetAll();

private:
    friend class ScopeHandle;

    static void pop(const ScopeFrame& frame);
    static bool isStale(const ScopeFrame& frame);
};

} // namespace strata::di
