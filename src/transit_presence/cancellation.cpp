#include "transit_presence/cancellation.hpp"

namespace transit_presence {

void CancellationToken::cancel() {
    {
        std::scoped_lock lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::cancelled() const {
    std::scoped_lock lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(Duration delay) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, to_steady(delay), [this]() { return cancelled_; });
    return cancelled_;
}

}  // namespace transit_presence
