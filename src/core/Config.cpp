#include "core/Config.hpp"
#include "core/GestureClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

int parseInt(const std::string& key, const std::string& value, int minValue, int maxValue) {
    size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    if (parsed < minValue || parsed > maxValue) {
        std::ostringstream ss;
        ss << key << ": " << parsed << " out of range [" << minValue << ", " << maxValue << "]";
        throw std::invalid_argument(ss.str());
    }
    return static_cast<int>(parsed);
}

uint64_t parseUnsigned(const std::string& key, const std::string& value) {
    size_t pos = 0;
    unsigned long long parsed = 0;
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value + "'");
    }
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value + "'");
    }
    return static_cast<uint64_t>(parsed);
}

float parsePositiveFloat(const std::string& key, const std::string& value) {
    size_t pos = 0;
    float parsed = 0.0f;
    try {
        parsed = std::stof(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected a number, got '" + value + "'");
    }
    if (pos != value.size() || !(parsed > 0.0f)) {
        throw std::invalid_argument(key + ": expected a positive number, got '" + value + "'");
    }
    return parsed;
}

} // namespace

Config Config::fromArgs(int argc, const char* const* argv) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const std::string key = argv[i];

        // Flags without a value
        if (key == "--help" || key == "-h") {
            config.showHelp = true;
            continue;
        }
        if (key == "--preview") {
            config.preview = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument(key + ": missing value");
        }
        const std::string value = argv[++i];

        if (key == "--source") {
            if (value == "synthetic") config.source = Source::Synthetic;
            else if (value == "osc") config.source = Source::Osc;
            else if (value == "none") config.source = Source::None;
            else throw std::invalid_argument("--source: unknown source '" + value + "'");
        } else if (key == "--osc-in-port") {
            config.oscInPort = parseInt(key, value, 1, 65535);
        } else if (key == "--osc-out-host") {
            config.oscOutHost = value;
        } else if (key == "--osc-out-port") {
            config.oscOutPort = parseInt(key, value, 1, 65535);
        } else if (key == "--osc-rate") {
            config.oscRateHz = parseInt(key, value, 1, 240);
        } else if (key == "--viewport-width") {
            config.viewportWidth = parseInt(key, value, 1, 16384);
        } else if (key == "--seed") {
            config.seed = parseUnsigned(key, value);
        } else if (key == "--fps") {
            config.fps = parsePositiveFloat(key, value);
        } else if (key == "--frames") {
            config.maxFrames = parseUnsigned(key, value);
        } else if (key == "--preview-size") {
            auto sep = value.find('x');
            if (sep == std::string::npos) {
                throw std::invalid_argument("--preview-size: expected WIDTHxHEIGHT, got '" + value + "'");
            }
            config.previewWidth = parseInt(key, value.substr(0, sep), 64, 7680);
            config.previewHeight = parseInt(key, value.substr(sep + 1), 64, 4320);
        } else if (key == "--record") {
            config.recordPath = value;
        } else if (key == "--force") {
            auto gesture = parseGesture(value);
            if (!gesture) {
                throw std::invalid_argument("--force: unknown gesture '" + value + "'");
            }
            config.forcedGesture = *gesture;
        } else if (key == "--text") {
            auto text = normalizeCustomText(value);
            if (!text) {
                throw std::invalid_argument("--text: text must not be empty");
            }
            config.customText = *text;
        } else if (key == "--log-level") {
            auto level = Logger::parseLevel(value);
            if (!level) {
                throw std::invalid_argument("--log-level: unknown level '" + value + "'");
            }
            config.logLevel = *level;
        } else {
            throw std::invalid_argument("unknown option '" + key + "'");
        }
    }

    return config;
}

std::string Config::usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "  --source synthetic|osc|none   landmark source (default synthetic)\n"
       << "  --osc-in-port N               port for /hand/landmarks (default " << OSC_IN_PORT << ")\n"
       << "  --osc-out-host HOST           publish morph state to HOST (default off)\n"
       << "  --osc-out-port N              OSC output port (default " << OSC_OUT_PORT << ")\n"
       << "  --osc-rate HZ                 OSC output rate (default " << OSC_RATE_HZ << ")\n"
       << "  --viewport-width PX           < " << NARROW_VIEWPORT_WIDTH << " uses "
       << PARTICLE_COUNT_NARROW << " particles, else " << PARTICLE_COUNT_WIDE << "\n"
       << "  --seed N                      random seed (default random)\n"
       << "  --fps F                       frame rate (default " << TARGET_FPS << ")\n"
       << "  --frames N                    stop after N frames (default unlimited)\n"
       << "  --preview                     open an OpenCV preview window\n"
       << "  --preview-size WxH            preview resolution (default 960x540)\n"
       << "  --record FILE                 write preview frames to a video file\n"
       << "  --force GESTURE               force none|fist|open|peace|metal at start\n"
       << "  --text TEXT                   custom display text\n"
       << "  --log-level LEVEL             debug|info|warn|error (default info)\n"
       << "  --help                        show this message\n";
    return ss.str();
}

const char* getSourceName(Config::Source source) {
    switch (source) {
        case Config::Source::Synthetic: return "synthetic";
        case Config::Source::Osc:       return "osc";
        case Config::Source::None:      return "none";
        default: return "unknown";
    }
}

std::optional<std::string> normalizeCustomText(const std::string& text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (begin >= end) {
        return std::nullopt;
    }

    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace core
