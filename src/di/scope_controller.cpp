#include "strata/di/scope_controller.hpp"

#include <atomic>
#include <exception>
#include <utility>

#include "strata/di/service_error.hpp"
#include "strata/util/logging.hpp"

namespace strata::di {

namespace {

std::atomic<std::uint64_t> scope_epoch{0};

struct ThreadScopeState {
    std::shared_ptr<const ScopeFrame> top;
    std::size_t depth = 0;
    std::uint64_t epoch = 0;
};

thread_local ThreadScopeState thread_state;

// Current thread's state, emptied first if a reset happened since it was last used
ThreadScopeState& syncedState() {
    auto epoch = scope_epoch.load(std::memory_order_acquire);
    if (thread_state.epoch != epoch) {
        thread_state.top.reset();
        thread_state.depth = 0;
        thread_state.epoch = epoch;
    }
    return thread_state;
}

std::string describe(const ScopeFrame& frame) {
    if (frame.kind() == ScopeKind::kNamespace) {
        return "namespace scope '" + frame.namespaceScope() + "'";
    }
    return "object scope '" + frame.scopeOwner().typeName() + "'";
}

} // namespace

ScopeFrame::ScopeFrame(std::string namespace_scope, std::shared_ptr<const ScopeFrame> previous,
                       std::uint64_t epoch)
    : kind_(ScopeKind::kNamespace),
      namespace_scope_(std::move(namespace_scope)),
      previous_(std::move(previous)),
      epoch_(epoch) {}

ScopeFrame::ScopeFrame(ObjectIdentity scope_owner, std::shared_ptr<const ScopeFrame> previous,
                       std::uint64_t epoch)
    : kind_(ScopeKind::kObject),
      scope_owner_(scope_owner),
      previous_(std::move(previous)),
      epoch_(epoch) {}

ScopeHandle::ScopeHandle(std::shared_ptr<const ScopeFrame> frame)
    : frame_(std::move(frame)) {}

ScopeHandle::ScopeHandle(ScopeHandle&& other) noexcept
    : frame_(std::move(other.frame_)) {}

ScopeHandle& ScopeHandle::operator=(ScopeHandle&& other) {
    if (this != &other) {
        release();
        frame_ = std::move(other.frame_);
    }
    return *this;
}

ScopeHandle::~ScopeHandle() {
    if (!frame_) {
        return;
    }

    try {
        release();
    } catch (const ServiceResolutionException& e) {
        util::logger()->critical("Fatal ambient scope violation: {}", e.what());
        std::terminate();
    }
}

void ScopeHandle::release() {
    if (!frame_) {
        return;
    }

    if (ScopeController::isStale(*frame_)) {
        // Discarded by a registry reset; nothing left to pop
        frame_.reset();
        return;
    }

    ScopeController::pop(*frame_);
    frame_.reset();
}

ScopeHandle ScopeController::pushNamespace(std::string namespace_scope) {
    auto& state = syncedState();
    auto frame = std::make_shared<const ScopeFrame>(std::move(namespace_scope), state.top, state.epoch);
    state.top = frame;
    ++state.depth;
    return ScopeHandle(std::move(frame));
}

ScopeHandle ScopeController::pushObject(const ObjectIdentity& scope_owner) {
    auto& state = syncedState();
    auto frame = std::make_shared<const ScopeFrame>(scope_owner, state.top, state.epoch);
    state.top = frame;
    ++state.depth;
    return ScopeHandle(std::move(frame));
}

std::shared_ptr<const ScopeFrame> ScopeController::current() {
    return syncedState().top;
}

std::size_t ScopeController::depth() {
    return syncedState().depth;
}

void ScopeController::resetAll() {
    scope_epoch.fetch_add(1, std::memory_order_acq_rel);
    syncedState();
}

bool ScopeController::isStale(const ScopeFrame& frame) {
    return frame.epoch() != scope_epoch.load(std::memory_order_acquire);
}

void ScopeController::pop(const ScopeFrame& frame) {
    auto& state = syncedState();
    if (state.top.get() != &frame) {
        util::logger()->error("Scope disposed out of order: {} is not the innermost scope",
                              describe(frame));
        throw ServiceResolutionException(
            ErrorCode::kOutOfOrderScopeDispose,
            "Scope disposed out of order: " + describe(frame) +
                " is not the innermost scope of the calling thread.");
    }

    state.top = frame.previous();
    --state.depth;
}

} // namespace strata::di
