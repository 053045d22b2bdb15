#pragma once

#include <atomic>
#include <memory>
#include <lo/lo.h>

#include "core/Types.hpp"
#include "input/LandmarkSource.hpp"

namespace input {

/**
 * Receives hand landmarks from an external tracker over OSC (liblo server thread).
 *
 * Accepted messages:
 *   /hand/landmarks  b        21 x (x, y, z) float32
 *   /hand/tracking   i b ...  tracking-service layout, blob is the second argument
 *   /hand/lost                no hand in view
 *
 * Only the first hand is used; blobs with extra points are truncated to 21.
 */
class OscLandmarkReceiver : public LandmarkSource {
public:
    OscLandmarkReceiver(std::shared_ptr<core::LandmarkQueue> outputQueue, int port);
    ~OscLandmarkReceiver() override;

    bool start() override;
    void stop() override;

    [[nodiscard]] const char* name() const override { return "osc"; }

private:
    static int onLandmarks(const char* path, const char* types, lo_arg** argv, int argc,
                           lo_message msg, void* userData);
    static int onTracking(const char* path, const char* types, lo_arg** argv, int argc,
                          lo_message msg, void* userData);
    static int onLost(const char* path, const char* types, lo_arg** argv, int argc,
                      lo_message msg, void* userData);
    static void onError(int num, const char* msg, const char* where);

    void handleBlob(lo_blob blob);
    void publish(core::LandmarkList landmarks);

    std::shared_ptr<core::LandmarkQueue> outputQueue_;
    int port_;

    lo_server_thread server_ = nullptr;
    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace input
