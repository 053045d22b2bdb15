#include "core/LandmarkBlob.hpp"
#include <cstring>

namespace core {

std::optional<LandmarkList> decodeLandmarkBlob(const void* data, size_t size) {
    if (size == 0) {
        return LandmarkList{};
    }
    if (!data || size < LANDMARK_BLOB_SIZE) {
        return std::nullopt;
    }

    const auto* bytes = static_cast<const unsigned char*>(data);
    LandmarkList landmarks(LANDMARK_COUNT);
    for (size_t i = 0; i < LANDMARK_COUNT; ++i) {
        float xyz[3];
        std::memcpy(xyz, bytes + i * LANDMARK_BLOB_STRIDE, LANDMARK_BLOB_STRIDE);
        landmarks[i] = {xyz[0], xyz[1], xyz[2]};
    }
    return landmarks;
}

} // namespace core
