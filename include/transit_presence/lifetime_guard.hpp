// === Lifetime Guard ==========================================================
//
// Shared token handed to callbacks that may outlive the component which
// registered them: scheduler tasks, store subscriptions, provider callbacks.
// The owner retires the guard first thing in its destructor. Retiring waits
// for a callback already running under the guard, and every callback that
// starts afterwards is skipped without touching the owner.

#pragma once

#include <memory>
#include <mutex>

namespace transit_presence {

class LifetimeGuard final {
  public:
    /**
     * @brief Run @p body while the owner is alive.
     *
     * @return false when the owner has already retired the guard.
     */
    template <typename Body>
    bool run_if_alive(Body&& body) {
        std::scoped_lock lock(mutex_);
        if (!alive_) {
            return false;
        }
        body();
        return true;
    }

    /** @brief Mark the owner as gone. Blocks until a running body returns. */
    void retire() {
        std::scoped_lock lock(mutex_);
        alive_ = false;
    }

  private:
    // Recursive: a guarded body may re-enter the owner on the same thread.
    std::recursive_mutex mutex_;
    bool alive_{true};
};

using LifetimeGuardPtr = std::shared_ptr<LifetimeGuard>;

}  // namespace transit_presence
