#include "net/OscSender.hpp"
#include "core/GestureClassifier.hpp"
#include <chrono>

namespace net {

namespace {

// Snapshots older than this are superseded before they could be useful
constexpr int64_t MAX_STATE_AGE_MS = 100;

} // namespace

OscSender::OscSender(std::shared_ptr<core::StateQueue> inputQueue, const std::string& host, const std::string& port)
    : _inputQueue(std::move(inputQueue)), _host(host), _port(port), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscSender::start() {
    if (_running) return true;

    if (!_loAddress) {
        _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    }
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    core::Logger::info("OscSender stopped.");
}

void OscSender::loop() {
    while (_running) {
        core::MorphState state;
        if (_inputQueue->drain_latest(state) > 0) {
            auto now = std::chrono::steady_clock::now();
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - state.timestamp).count();
            if (age > MAX_STATE_AGE_MS) {
                continue;
            }

            send(state);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void OscSender::send(const core::MorphState& state) {
    if (!_loAddress) return;

    int failures = 0;
    auto dispatch = [&](const char* path, lo_message msg) {
        if (lo_send_message(_loAddress, path, msg) == -1) {
            ++failures;
        }
        lo_message_free(msg);
    };

    lo_message gestMsg = lo_message_new();
    lo_message_add_int32(gestMsg, static_cast<int32_t>(state.gesture));
    lo_message_add_string(gestMsg, core::getGestureName(state.gesture));
    dispatch("/morph/gesture", gestMsg);

    lo_message anchorMsg = lo_message_new();
    lo_message_add_float(anchorMsg, state.anchor.x);
    lo_message_add_float(anchorMsg, state.anchor.y);
    lo_message_add_float(anchorMsg, state.anchor.z);
    dispatch("/morph/anchor", anchorMsg);

    lo_message countMsg = lo_message_new();
    lo_message_add_int32(countMsg, static_cast<int32_t>(state.particleCount));
    dispatch("/morph/particles", countMsg);

    lo_message overrideMsg = lo_message_new();
    lo_message_add_int32(overrideMsg, state.forced ? 1 : 0);
    lo_message_add_float(overrideMsg, state.overrideRemaining);
    dispatch("/morph/override", overrideMsg);

    lo_message textMsg = lo_message_new();
    lo_message_add_string(textMsg, state.customText.c_str());
    dispatch("/morph/text", textMsg);

    if (failures > 0 && _sendErrors++ % 100 == 0) {
        core::Logger::error("OscSender: Failed to send ", failures, " messages: ", lo_address_errstr(_loAddress));
    }
}

} // namespace net
