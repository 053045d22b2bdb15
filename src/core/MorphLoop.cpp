#include "core/MorphLoop.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace core {

MorphLoop::MorphLoop(std::shared_ptr<LandmarkQueue> inputQueue,
                     std::shared_ptr<StateQueue> stateQueue,
                     const Settings& settings)
    : inputQueue_(std::move(inputQueue)),
      stateQueue_(std::move(stateQueue)),
      engine_(settings.particleCount, settings.seed),
      timeStep_(settings.timeStep),
      statePeriod_(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(1.0 / std::max(1, settings.stateRateHz)))) {

    context_.customText = settings.customText;

    controller_.setTransitionCallback([](Gesture from, Gesture to) {
        Logger::info("MorphLoop: gesture ", getGestureName(from), " -> ", getGestureName(to),
                     " (", getGestureDisplayName(to), ")");
    });

    Logger::info("MorphLoop: ", settings.particleCount, " particles, seed=", settings.seed);
}

const SimulationContext& MorphLoop::step(Clock::time_point now) {
    consumeObservations(now);

    GestureResult result = controller_.current();
    context_.gesture = result.gesture;
    context_.anchor = result.anchor;
    context_.elapsed += timeStep_;
    context_.frame++;

    engine_.step(context_);

    publishState(now);
    updateFps(now);
    return context_;
}

void MorphLoop::consumeObservations(Clock::time_point now) {
    size_t consumed = inputQueue_ ? inputQueue_->drain_latest(latestFrame_) : 0;

    if (consumed == 0) {
        if (latestFrame_.hasHand() && now - lastObservation_ > HAND_LOST_TIMEOUT) {
            // Tracker went quiet while a hand was shown
            if (handTimeouts_++ % 100 == 0) {
                Logger::info("MorphLoop: no tracker result for ",
                             std::chrono::duration_cast<std::chrono::milliseconds>(now - lastObservation_).count(),
                             " ms, treating hand as lost");
            }
            latestFrame_.landmarks.clear();
            controller_.update(latestFrame_.landmarks, now);
            return;
        }

        // No new tracker result this frame: last observation stays in effect
        controller_.tick(now);
        return;
    }

    if (consumed > 1) {
        Logger::debug("MorphLoop: skipped ", consumed - 1, " stale tracker results");
    }

    observationCount_++;
    lastObservation_ = now;
    controller_.update(latestFrame_.landmarks, now);
}

void MorphLoop::forceGesture(Gesture gesture, Clock::time_point now) {
    controller_.forceGesture(gesture, now);
}

bool MorphLoop::resizeForViewport(int viewportWidth) {
    size_t count = particleCountForViewport(viewportWidth);
    Logger::info("MorphLoop: viewport width ", viewportWidth, " -> ", count, " particles");
    return resize(count);
}

bool MorphLoop::resize(size_t particleCount) {
    return engine_.resize(particleCount);
}

bool MorphLoop::setCustomText(const std::string& text) {
    auto normalized = normalizeCustomText(text);
    if (!normalized) {
        Logger::warn("MorphLoop: ignoring empty custom text");
        return false;
    }
    context_.customText = *normalized;
    Logger::info("MorphLoop: custom text set to '", context_.customText, "'");
    return true;
}

void MorphLoop::publishState(Clock::time_point now) {
    if (!stateQueue_) return;
    if (now - lastStatePublish_ < statePeriod_) return;
    lastStatePublish_ = now;

    const auto& forced = controller_.getOverride();

    MorphState state;
    state.gesture = context_.gesture;
    state.anchor = context_.anchor;
    state.particleCount = static_cast<uint32_t>(engine_.particles().size());
    state.forced = forced.isActive();
    state.overrideRemaining = std::chrono::duration<float>(forced.remaining(now)).count();
    state.customText = context_.customText;
    state.timestamp = now;

    if (!stateQueue_->try_push(std::move(state))) {
        // Sender not keeping up: drop, the next snapshot supersedes this one
        if (droppedStates_++ % 100 == 0) {
            Logger::warn("MorphLoop: state queue full, dropped ", droppedStates_, " snapshots");
        }
    }
}

void MorphLoop::updateFps(Clock::time_point now) {
    if (lastFpsTime_ == Clock::time_point{}) {
        lastFpsTime_ = now;
    }

    frameCount_++;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastFpsTime_).count();
    if (elapsed >= 1000) {
        currentFps_ = static_cast<float>(frameCount_) * 1000.0f / static_cast<float>(elapsed);
        frameCount_ = 0;
        lastFpsTime_ = now;

        const auto& f = controller_.getLastFingers();
        Logger::debug("MorphLoop: ", currentFps_, " fps, gesture=", getGestureName(context_.gesture),
                      " fingers=", f.thumb, f.index, f.middle, f.ring, f.pinky,
                      " anchor=(", context_.anchor.x, ", ", context_.anchor.y, ", ", context_.anchor.z, ")");
    }
}

} // namespace core
