#include "core/ShapeField.hpp"
#include <array>
#include <cmath>

namespace core {

namespace {

constexpr float TWO_PI = 6.28318f;
constexpr float PI = 3.14159f;

// Indexed by gesture code
const std::array<ShapeDefinition, GESTURE_COUNT> SHAPES = {{
    {Gesture::None,  &shapes::ambientDrift, 0.02f, {0.5f, 0.1f}},   // cyan
    {Gesture::Fist,  &shapes::ringedPlanet, 0.95f, {0.08f, 0.1f}},  // gold
    {Gesture::Open,  &shapes::coreHalo,     0.9f,  {0.4f, 0.15f}},  // green-cyan
    {Gesture::Peace, &shapes::textSlots,    0.92f, {0.6f, 0.2f}},   // blue-purple
    {Gesture::Metal, &shapes::heart,        0.94f, {0.95f, 0.1f}},  // pink-red
}};

} // namespace

const ShapeDefinition& shapeFor(Gesture gesture) {
    auto code = static_cast<int32_t>(gesture);
    if (code < 0 || code >= static_cast<int32_t>(SHAPES.size())) {
        return SHAPES[0];
    }
    return SHAPES[code];
}

namespace shapes {

bool isRingMember(float r3) {
    return r3 >= MEMBERSHIP_THRESHOLD;
}

bool isCoreMember(float r3) {
    return r3 >= MEMBERSHIP_THRESHOLD;
}

int textSlot(float r0) {
    return static_cast<int>(std::floor(r0 * static_cast<float>(TEXT_SLOT_COUNT)));
}

HeartPoint heartCurve(float theta) {
    float s = std::sin(theta);
    return {
        16.0f * s * s * s,
        13.0f * std::cos(theta) - 5.0f * std::cos(2.0f * theta)
            - 2.0f * std::cos(3.0f * theta) - std::cos(4.0f * theta)
    };
}

float heartBeatScale(float t) {
    return 5.0f * (1.0f + std::sin(t * 8.0f) * 0.1f);
}

Point3D ambientDrift(const ShapeInput& input, const ShapeParticle& particle) {
    const auto& rnd = particle.randoms;
    float speed = rnd.r1 * 0.5f + 0.5f;
    float phase = rnd.r2 * TWO_PI;
    float t = input.t;

    return {
        particle.base.x + std::sin(t * speed + phase) * 50.0f,
        particle.base.y + std::cos(t * speed * 0.7f + phase) * 50.0f,
        particle.base.z + std::sin(t * 0.3f + rnd.r0 * 10.0f) * 30.0f
    };
}

Point3D ringedPlanet(const ShapeInput& input, const ShapeParticle& particle) {
    const auto& hand = input.hand;
    const auto& rnd = particle.randoms;
    float t = input.t;

    if (isRingMember(rnd.r3)) {
        float ringAngle = rnd.r0 * TWO_PI + t * 0.3f;
        float ringRadius = 120.0f + rnd.r0 * 80.0f;
        return {
            hand.x + std::cos(ringAngle) * ringRadius,
            hand.y + std::sin(ringAngle) * ringRadius * 0.2f,
            hand.z + std::sin(ringAngle) * ringRadius * 0.5f
        };
    }

    float planetRadius = rnd.r0 * 60.0f;
    float theta = rnd.r3 * PI;
    float phi = rnd.r0 * TWO_PI + t * 0.5f;
    return {
        hand.x + planetRadius * std::sin(theta) * std::cos(phi),
        hand.y + planetRadius * std::sin(theta) * std::sin(phi),
        hand.z + planetRadius * std::cos(theta)
    };
}

Point3D coreHalo(const ShapeInput& input, const ShapeParticle& particle) {
    const auto& hand = input.hand;
    const auto& rnd = particle.randoms;
    float t = input.t;

    if (isCoreMember(rnd.r3)) {
        float sphereRadius = rnd.r0 * 50.0f;
        float theta = rnd.r0 * PI;
        float phi = rnd.r3 * TWO_PI;
        return {
            hand.x + sphereRadius * std::sin(theta) * std::cos(phi),
            hand.y + sphereRadius * std::sin(theta) * std::sin(phi),
            hand.z + sphereRadius * std::cos(theta)
        };
    }

    float wanderRadius = 200.0f + rnd.r0 * 200.0f;
    float angle = t * 0.2f + rnd.r2 * TWO_PI;
    return {
        hand.x + std::cos(angle) * wanderRadius,
        hand.y + std::sin(angle * 1.3f) * wanderRadius,
        hand.z + std::sin(t + rnd.r0 * 10.0f) * 100.0f
    };
}

Point3D textSlots(const ShapeInput& input, const ShapeParticle& particle) {
    const auto& hand = input.hand;
    const auto& rnd = particle.randoms;
    float t = input.t;

    float slotX = (static_cast<float>(textSlot(rnd.r0)) - 3.0f) * TEXT_SLOT_SPACING;
    float yOffset = std::sin(rnd.r0 * 20.0f + t) * 5.0f;

    return {
        hand.x + slotX + (rnd.r3 - 0.5f) * 30.0f,
        hand.y + yOffset + (rnd.r0 - 0.5f) * 60.0f,
        hand.z + std::sin(t * 2.0f + rnd.r0 * 10.0f) * 20.0f
    };
}

Point3D heart(const ShapeInput& input, const ShapeParticle& particle) {
    const auto& hand = input.hand;
    float t = input.t;

    float theta = particle.randoms.r0 * TWO_PI;
    HeartPoint curve = heartCurve(theta);
    float scale = heartBeatScale(t);

    // Curve Y is subtracted: the cusp points up, lobes down
    return {
        hand.x + curve.x * scale,
        hand.y - curve.y * scale + 20.0f,
        hand.z + std::sin(theta * 3.0f + t) * 30.0f
    };
}

} // namespace shapes

} // namespace core
