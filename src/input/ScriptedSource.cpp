#include "input/ScriptedSource.hpp"
#include "input/SyntheticHand.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <cmath>

namespace input {

ScriptedSource::ScriptedSource(std::shared_ptr<core::LandmarkQueue> outputQueue, float rateHz)
    : ScriptedSource(std::move(outputQueue), defaultScript(), rateHz) {
}

ScriptedSource::ScriptedSource(std::shared_ptr<core::LandmarkQueue> outputQueue, std::vector<Step> script,
                               float rateHz)
    : outputQueue_(std::move(outputQueue)), script_(std::move(script)), rateHz_(rateHz) {
    for (const auto& step : script_) {
        scriptLength_ += step.holdSeconds;
    }
}

ScriptedSource::~ScriptedSource() {
    stop();
}

std::vector<ScriptedSource::Step> ScriptedSource::defaultScript() {
    return {
        {core::Gesture::Open,  true,  4.0f},
        {core::Gesture::Fist,  true,  5.0f},
        {core::Gesture::None,  true,  2.0f},   // Ambiguous: keeps fist
        {core::Gesture::Peace, true,  5.0f},
        {core::Gesture::Metal, true,  5.0f},
        {core::Gesture::None,  false, 4.0f},   // Hand lost
    };
}

bool ScriptedSource::start() {
    if (running_) return true;
    if (script_.empty() || scriptLength_ <= 0.0 || rateHz_ <= 0.0f) {
        core::Logger::error("ScriptedSource: empty script or invalid rate, not starting");
        return false;
    }

    running_ = true;
    thread_ = std::thread(&ScriptedSource::loop, this);
    core::Logger::info("ScriptedSource started (", script_.size(), " steps, ", scriptLength_, "s loop, ",
                       rateHz_, " Hz)");
    return true;
}

void ScriptedSource::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    core::Logger::info("ScriptedSource stopped.");
}

core::HandFrame ScriptedSource::frameAt(double seconds, uint64_t sequence) const {
    core::HandFrame frame;
    frame.sequence = sequence;
    frame.timestamp = std::chrono::steady_clock::now();

    if (script_.empty() || scriptLength_ <= 0.0) {
        return frame;
    }

    double t = std::fmod(seconds, scriptLength_);
    const Step* current = &script_.back();
    for (const auto& step : script_) {
        if (t < step.holdSeconds) {
            current = &step;
            break;
        }
        t -= step.holdSeconds;
    }

    if (!current->handVisible) {
        return frame;
    }

    SyntheticHand::Placement placement;
    placement.x = 0.5f + 0.2f * static_cast<float>(std::sin(seconds * 0.7));
    placement.y = 0.55f + 0.1f * static_cast<float>(std::sin(seconds * 1.1));
    placement.z = -0.1f * static_cast<float>(std::sin(seconds * 0.3));

    frame.landmarks = SyntheticHand::makePose(SyntheticHand::fingersFor(current->gesture), placement);
    return frame;
}

void ScriptedSource::loop() {
    using Clock = std::chrono::steady_clock;

    const auto period = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / rateHz_));
    const auto startTime = Clock::now();
    auto nextTick = startTime;
    uint64_t sequence = 0;
    uint64_t dropped = 0;

    while (running_) {
        double seconds = std::chrono::duration<double>(Clock::now() - startTime).count();

        if (!outputQueue_->try_push(frameAt(seconds, sequence))) {
            // Queue full -> consumer stalled, drop this result
            if (dropped++ % 100 == 0) {
                core::Logger::warn("ScriptedSource: output queue full, dropping result seq=", sequence,
                                   " (", dropped, " dropped)");
            }
        }
        sequence++;

        nextTick += period;
        std::this_thread::sleep_until(nextTick);
    }
}

} // namespace input
