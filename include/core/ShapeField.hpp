#pragma once

#include "Types.hpp"
#include "ParticleSet.hpp"

namespace core {

/**
 * Inputs shared by every particle in one frame
 */
struct ShapeInput {
    Point3D hand;   // Anchor in scene units (anchor * SCENE_SCALE)
    float t = 0.0f; // Elapsed time * TIME_SCALE
};

/**
 * Per-particle inputs
 */
struct ShapeParticle {
    Point3D base;
    ParticleRandoms randoms;
};

// (frame input, particle) -> target position
using TargetFunction = Point3D (*)(const ShapeInput& input, const ShapeParticle& particle);

struct ShapeDefinition {
    Gesture gesture;
    TargetFunction target;
    float blend;        // Approach rate, scaled by BLEND_SCALE per frame
    HuePalette palette;
};

/**
 * Shape for a gesture. Values outside the enumeration get the None shape.
 */
[[nodiscard]] const ShapeDefinition& shapeFor(Gesture gesture);

namespace shapes {

// None: drift around the particle's own base position
[[nodiscard]] Point3D ambientDrift(const ShapeInput& input, const ShapeParticle& particle);

// Fist: flattened rotating ring around a small rotating sphere
[[nodiscard]] Point3D ringedPlanet(const ShapeInput& input, const ShapeParticle& particle);

// Open: dense core sphere plus particles orbiting far out
[[nodiscard]] Point3D coreHalo(const ShapeInput& input, const ShapeParticle& particle);

// Peace: blocky text-like cluster of character slots
[[nodiscard]] Point3D textSlots(const ShapeInput& input, const ShapeParticle& particle);

// Metal: pulsing parametric heart
[[nodiscard]] Point3D heart(const ShapeInput& input, const ShapeParticle& particle);

// r3 >= MEMBERSHIP_THRESHOLD belongs to the ring (Fist)
[[nodiscard]] bool isRingMember(float r3);

// r3 >= MEMBERSHIP_THRESHOLD belongs to the core sphere (Open)
[[nodiscard]] bool isCoreMember(float r3);

// floor(r0 * TEXT_SLOT_COUNT)
[[nodiscard]] int textSlot(float r0);

struct HeartPoint {
    float x;
    float y;
};

// x = 16 sin^3, y = 13 cos - 5 cos 2 - 2 cos 3 - cos 4
[[nodiscard]] HeartPoint heartCurve(float theta);

// 5 * (1 + 0.1 sin(8t))
[[nodiscard]] float heartBeatScale(float t);

} // namespace shapes

} // namespace core
