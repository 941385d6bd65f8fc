// === Cancellation ============================================================
//
// Cooperative cancellation flag for bootstrap work running on detached
// threads. Sleeping through `wait_for` wakes up as soon as the token is
// cancelled, so an abandoned attempt stops at its next checkpoint.

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

#include "transit_presence/types.hpp"

namespace transit_presence {

class CancellationToken final {
  public:
    void cancel();
    [[nodiscard]] bool cancelled() const;

    /**
     * @brief Sleep for @p delay unless cancelled first.
     *
     * @return true when the token was cancelled.
     */
    bool wait_for(Duration delay);

  private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace transit_presence
