#pragma once

namespace input {

/**
 * A producer of tracker results running on its own thread.
 * Results go into a core::LandmarkQueue owned by the caller.
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * @return false if the source could not be started (logged)
     */
    virtual bool start() = 0;
    virtual void stop() = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace input
