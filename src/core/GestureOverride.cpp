#include "core/GestureOverride.hpp"

namespace core {

void GestureOverride::force(Gesture gesture, Clock::time_point now, Clock::duration duration) {
    entry_ = Entry{gesture, now + duration};
}

bool GestureOverride::expire(Clock::time_point now) {
    if (!entry_ || now < entry_->expiry) {
        return false;
    }
    entry_.reset();
    return true;
}

Gesture GestureOverride::gesture() const {
    return entry_ ? entry_->gesture : Gesture::None;
}

GestureOverride::Clock::duration GestureOverride::remaining(Clock::time_point now) const {
    if (!entry_ || now >= entry_->expiry) {
        return Clock::duration::zero();
    }
    return entry_->expiry - now;
}

} // namespace core
