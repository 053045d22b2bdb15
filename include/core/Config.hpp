#pragma once

#include "Types.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>

namespace core {

/**
 * Runtime configuration for the gesture morph service.
 * Defaults come from Types.hpp; main() fills it from the command line.
 */
struct Config {
    enum class Source {
        Synthetic,  // Scripted hand poses, no camera needed
        Osc,        // Landmarks from an external tracker over OSC
        None        // No hand at all (ambient drift only)
    };

    Source source = Source::Synthetic;

    int oscInPort = OSC_IN_PORT;
    std::string oscOutHost;             // Empty disables OSC output
    int oscOutPort = OSC_OUT_PORT;
    int oscRateHz = OSC_RATE_HZ;

    int viewportWidth = 1280;
    std::optional<uint64_t> seed;       // Random if unset
    float fps = TARGET_FPS;
    uint64_t maxFrames = 0;             // 0 runs until interrupted

    bool preview = false;
    int previewWidth = 960;
    int previewHeight = 540;
    std::string recordPath;             // Empty disables video output

    std::optional<Gesture> forcedGesture;
    std::string customText = "I LOVE U";

    LogLevel logLevel = LogLevel::INFO;
    bool showHelp = false;

    /**
     * Parse "--key value" style arguments.
     * Throws std::invalid_argument on unknown options or bad values.
     */
    static Config fromArgs(int argc, const char* const* argv);

    static std::string usage(const std::string& program);
};

[[nodiscard]] const char* getSourceName(Config::Source source);

/**
 * Trim and upper-case display text.
 * @return std::nullopt if nothing remains after trimming
 */
[[nodiscard]] std::optional<std::string> normalizeCustomText(const std::string& text);

} // namespace core
