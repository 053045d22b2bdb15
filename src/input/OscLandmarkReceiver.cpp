#include "input/OscLandmarkReceiver.hpp"
#include "core/LandmarkBlob.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <string>

namespace input {

OscLandmarkReceiver::OscLandmarkReceiver(std::shared_ptr<core::LandmarkQueue> outputQueue, int port)
    : outputQueue_(std::move(outputQueue)), port_(port) {
}

OscLandmarkReceiver::~OscLandmarkReceiver() {
    stop();
}

bool OscLandmarkReceiver::start() {
    if (server_) return true;

    std::string port = std::to_string(port_);
    server_ = lo_server_thread_new(port.c_str(), &OscLandmarkReceiver::onError);
    if (!server_) {
        core::Logger::error("OscLandmarkReceiver: Failed to open OSC server on port ", port_);
        return false;
    }

    lo_server_thread_add_method(server_, "/hand/landmarks", "b", &OscLandmarkReceiver::onLandmarks, this);
    lo_server_thread_add_method(server_, "/hand/tracking", nullptr, &OscLandmarkReceiver::onTracking, this);
    lo_server_thread_add_method(server_, "/hand/lost", nullptr, &OscLandmarkReceiver::onLost, this);

    if (lo_server_thread_start(server_) < 0) {
        core::Logger::error("OscLandmarkReceiver: Failed to start OSC server thread");
        lo_server_thread_free(server_);
        server_ = nullptr;
        return false;
    }

    core::Logger::info("OscLandmarkReceiver listening on UDP port ", port_);
    return true;
}

void OscLandmarkReceiver::stop() {
    if (!server_) return;
    lo_server_thread_stop(server_);
    lo_server_thread_free(server_);
    server_ = nullptr;
    core::Logger::info("OscLandmarkReceiver stopped (", sequence_.load(), " results, ",
                       rejected_.load(), " rejected).");
}

int OscLandmarkReceiver::onLandmarks(const char*, const char*, lo_arg** argv, int argc,
                                     lo_message, void* userData) {
    auto* self = static_cast<OscLandmarkReceiver*>(userData);
    if (argc >= 1) {
        self->handleBlob(reinterpret_cast<lo_blob>(argv[0]));
    }
    return 0;
}

int OscLandmarkReceiver::onTracking(const char*, const char* types, lo_arg** argv, int argc,
                                    lo_message, void* userData) {
    auto* self = static_cast<OscLandmarkReceiver*>(userData);
    // Layout: vipLocked(i), landmarks(b), pinch(f), gestureId(i), gestureName(s)
    if (argc >= 2 && types && types[1] == LO_BLOB) {
        self->handleBlob(reinterpret_cast<lo_blob>(argv[1]));
    } else {
        self->rejected_++;
    }
    return 0;
}

int OscLandmarkReceiver::onLost(const char*, const char*, lo_arg**, int,
                                lo_message, void* userData) {
    auto* self = static_cast<OscLandmarkReceiver*>(userData);
    self->publish({});
    return 0;
}

void OscLandmarkReceiver::onError(int num, const char* msg, const char* where) {
    core::Logger::error("OscLandmarkReceiver: liblo error ", num, " in ", (where ? where : "?"), ": ",
                        (msg ? msg : "?"));
}

void OscLandmarkReceiver::handleBlob(lo_blob blob) {
    const uint32_t size = lo_blob_datasize(blob);
    auto landmarks = core::decodeLandmarkBlob(lo_blob_dataptr(blob), size);

    if (!landmarks) {
        if (rejected_++ % 100 == 0) {
            core::Logger::warn("OscLandmarkReceiver: landmark blob too small (", size, " bytes, need ",
                               core::LANDMARK_BLOB_SIZE, ")");
        }
        return;
    }

    // An empty list means the tracker lost the hand
    publish(std::move(*landmarks));
}

void OscLandmarkReceiver::publish(core::LandmarkList landmarks) {
    core::HandFrame frame;
    frame.landmarks = std::move(landmarks);
    const uint64_t sequence = sequence_++;
    frame.sequence = sequence;
    frame.timestamp = std::chrono::steady_clock::now();

    if (!outputQueue_->try_push(std::move(frame))) {
        core::Logger::warn("OscLandmarkReceiver: output queue full, dropping result seq=", sequence);
    }
}

} // namespace input
