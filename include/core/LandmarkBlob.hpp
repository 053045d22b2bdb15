#pragma once

#include "Types.hpp"
#include <optional>

namespace core {

// One landmark on the wire: x, y, z as native float32
constexpr size_t LANDMARK_BLOB_STRIDE = 3 * sizeof(float);
constexpr size_t LANDMARK_BLOB_SIZE = LANDMARK_COUNT * LANDMARK_BLOB_STRIDE;

/**
 * Decode a tracker landmark blob (21 x (x, y, z) float32).
 *
 * - size 0: hand lost, returns an empty list
 * - size < LANDMARK_BLOB_SIZE: std::nullopt (rejected)
 * - larger blobs: the first 21 points are used, the rest is ignored
 */
[[nodiscard]] std::optional<LandmarkList> decodeLandmarkBlob(const void* data, size_t size);

} // namespace core
