#pragma once

#include "Types.hpp"
#include <chrono>
#include <optional>

namespace core {

/**
 * GestureOverride: a manually forced gesture with an expiry time.
 *
 * There is no timer. The owner compares against its clock every frame via
 * expire(); forcing again replaces the pending expiry.
 */
class GestureOverride {
public:
    using Clock = std::chrono::steady_clock;

    void force(Gesture gesture, Clock::time_point now,
               Clock::duration duration = FORCED_GESTURE_DURATION);

    /**
     * Drop the override if its expiry has been reached.
     * @return true exactly once, on the call that observed the expiry
     */
    bool expire(Clock::time_point now);

    void clear() { entry_.reset(); }

    [[nodiscard]] bool isActive() const { return entry_.has_value(); }

    /**
     * Forced gesture, Gesture::None when inactive
     */
    [[nodiscard]] Gesture gesture() const;

    /**
     * Time left before expiry, zero when inactive
     */
    [[nodiscard]] Clock::duration remaining(Clock::time_point now) const;

private:
    struct Entry {
        Gesture gesture;
        Clock::time_point expiry;
    };

    std::optional<Entry> entry_;
};

} // namespace core
