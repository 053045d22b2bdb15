#include "core/Config.hpp"
#include "core/GestureClassifier.hpp"
#include "core/Logger.hpp"
#include "core/MorphLoop.hpp"
#include "core/Types.hpp"
#include "input/OscLandmarkReceiver.hpp"
#include "input/ScriptedSource.hpp"
#include "net/OscSender.hpp"
#include "render/PreviewRenderer.hpp"
#include <csignal>
#include <atomic>
#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <chrono>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

std::unique_ptr<input::LandmarkSource> makeSource(const core::Config& config,
                                                  std::shared_ptr<core::LandmarkQueue> queue) {
    switch (config.source) {
        case core::Config::Source::Synthetic:
            return std::make_unique<input::ScriptedSource>(std::move(queue));
        case core::Config::Source::Osc:
            return std::make_unique<input::OscLandmarkReceiver>(std::move(queue), config.oscInPort);
        case core::Config::Source::None:
        default:
            return nullptr;
    }
}

// Preview keys: 1-5 force a shape, n/w simulate a narrow/wide viewport, q/Esc quit
void handleKey(int key, core::MorphLoop& loop, std::chrono::steady_clock::time_point now) {
    switch (key) {
        case '1': case '2': case '3': case '4': case '5':
            // Keys 1..5 map to gesture codes 0..4
            loop.forceGesture(core::gestureFromCode(key - '1'), now);
            break;
        case 'n': loop.resizeForViewport(core::NARROW_VIEWPORT_WIDTH - 1); break;
        case 'w': loop.resizeForViewport(core::NARROW_VIEWPORT_WIDTH); break;
        case 'q':
        case 27:
            g_running = false;
            break;
        default:
            break;
    }
}

} // namespace

int main(int argc, char** argv) {
    core::Config config;
    try {
        config = core::Config::fromArgs(argc, argv);
    } catch (const std::exception& e) {
        core::Logger::error("Invalid arguments: ", e.what());
        std::cerr << core::Config::usage(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        std::cout << core::Config::usage(argv[0]);
        return 0;
    }

    core::Logger::setLevel(config.logLevel);

    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::info("Starting GestureMorph...");

    try {
        // 1. Infrastructure
        auto landmarkQueue = std::make_shared<core::LandmarkQueue>();
        std::shared_ptr<core::StateQueue> stateQueue;
        if (!config.oscOutHost.empty()) {
            stateQueue = std::make_shared<core::StateQueue>();
        }

        // 2. Core
        core::MorphLoop::Settings settings;
        settings.particleCount = core::particleCountForViewport(config.viewportWidth);
        settings.seed = config.seed ? *config.seed : std::random_device{}();
        settings.stateRateHz = config.oscRateHz;
        settings.customText = config.customText;

        core::MorphLoop loop(landmarkQueue, stateQueue, settings);

        if (config.forcedGesture) {
            loop.forceGesture(*config.forcedGesture, std::chrono::steady_clock::now());
        }

        // 3. Landmark source (tracker stand-in or OSC input)
        auto source = makeSource(config, landmarkQueue);
        if (source && !source->start()) {
            core::Logger::warn("Landmark source '", source->name(), "' unavailable, running without a hand");
            source.reset();
        }

        // 4. OSC output
        std::unique_ptr<net::OscSender> oscSender;
        if (stateQueue) {
            oscSender = std::make_unique<net::OscSender>(stateQueue, config.oscOutHost,
                                                         std::to_string(config.oscOutPort));
            if (!oscSender->start()) {
                oscSender.reset();
            }
        }

        // 5. Preview
        std::unique_ptr<render::PreviewRenderer> preview;
        if (config.preview || !config.recordPath.empty()) {
            preview = std::make_unique<render::PreviewRenderer>(config.previewWidth, config.previewHeight,
                                                                settings.seed);
            if (!config.recordPath.empty() && !preview->openRecorder(config.recordPath, config.fps)) {
                core::Logger::warn("Recording disabled, preview continues");
            }
        }

        core::Logger::info("Service running (source=", core::getSourceName(config.source),
                           "). Press Ctrl+C to exit.");

        // Main loop: one synchronous pass per frame
        using Clock = std::chrono::steady_clock;
        const auto framePeriod = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(1.0 / config.fps));
        auto nextFrame = Clock::now();

        while (g_running) {
            auto now = Clock::now();
            const auto& ctx = loop.step(now);

            if (preview) {
                render::PreviewRenderer::Status status;
                status.fps = loop.getFps();
                status.forced = loop.controller().isForced();
                status.overrideRemaining =
                    std::chrono::duration<float>(loop.controller().getOverride().remaining(now)).count();
                status.source = source ? source->name() : "none";

                preview->render(loop.engine().particles(), ctx, status);
                if (config.preview) {
                    handleKey(preview->show(1), loop, now);
                }
            }

            if (config.maxFrames > 0 && ctx.frame >= config.maxFrames) {
                core::Logger::info("Reached ", config.maxFrames, " frames.");
                break;
            }

            nextFrame += framePeriod;
            auto after = Clock::now();
            if (nextFrame > after) {
                std::this_thread::sleep_until(nextFrame);
            } else {
                // Frame budget overrun: resync instead of bursting to catch up
                nextFrame = after;
            }
        }

        // Shutdown: producers first, then consumers
        core::Logger::info("Stopping modules...");
        if (source) source->stop();
        if (oscSender) oscSender->stop();

    } catch (const std::exception& e) {
        core::Logger::error("Fatal error in service loop: ", e.what());
        return 1;
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
