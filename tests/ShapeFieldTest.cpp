#include <gtest/gtest.h>

#include <cmath>

#include "core/ShapeField.hpp"

using core::Gesture;
using core::Point3D;
using core::ShapeInput;
using core::ShapeParticle;

namespace {

ShapeInput inputAt(Point3D hand, float t = 0.0f) {
    ShapeInput input;
    input.hand = hand;
    input.t = t;
    return input;
}

ShapeParticle particleWith(float r0, float r1, float r2, float r3, Point3D base = {}) {
    ShapeParticle particle;
    particle.base = base;
    particle.randoms = {r0, r1, r2, r3};
    return particle;
}

float distance(const Point3D& a, const Point3D& b) {
    float dx = a.x - b.x, dy = a.y - b.y, dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

} // namespace

TEST(ShapeTable, BlendAndPaletteValues) {
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::None).blend, 0.02f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Fist).blend, 0.95f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Open).blend, 0.9f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Peace).blend, 0.92f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Metal).blend, 0.94f);

    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::None).palette.base, 0.5f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Fist).palette.base, 0.08f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Open).palette.range, 0.15f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Peace).palette.range, 0.2f);
    EXPECT_FLOAT_EQ(core::shapeFor(Gesture::Metal).palette.base, 0.95f);
}

TEST(ShapeTable, EntriesMatchTheirGesture) {
    for (int32_t code = 0; code < static_cast<int32_t>(core::GESTURE_COUNT); ++code) {
        auto gesture = static_cast<Gesture>(code);
        EXPECT_EQ(core::shapeFor(gesture).gesture, gesture);
    }
}

TEST(ShapeTable, UnknownGestureFallsBackToIdle) {
    const auto& idle = core::shapeFor(Gesture::None);
    EXPECT_EQ(&core::shapeFor(static_cast<Gesture>(5)), &idle);
    EXPECT_EQ(&core::shapeFor(static_cast<Gesture>(-3)), &idle);
    EXPECT_EQ(&core::shapeFor(static_cast<Gesture>(1000)), &idle);
}

TEST(AmbientDrift, StaysAroundBasePosition) {
    Point3D base{120.0f, -340.0f, 75.0f};
    for (float t : {0.0f, 0.7f, 3.1f, 42.0f}) {
        for (float r : {0.0f, 0.25f, 0.5f, 0.99f}) {
            Point3D target = core::shapes::ambientDrift(inputAt({300.0f, 300.0f, 300.0f}, t),
                                                        particleWith(r, 1.0f - r, r * 0.5f, r, base));
            EXPECT_LE(std::abs(target.x - base.x), 50.0f + 1e-3f);
            EXPECT_LE(std::abs(target.y - base.y), 50.0f + 1e-3f);
            EXPECT_LE(std::abs(target.z - base.z), 30.0f + 1e-3f);
        }
    }
}

TEST(AmbientDrift, IgnoresHandPosition) {
    auto particle = particleWith(0.3f, 0.6f, 0.1f, 0.8f, {10.0f, 20.0f, 30.0f});
    Point3D a = core::shapes::ambientDrift(inputAt({0.0f, 0.0f, 0.0f}, 1.5f), particle);
    Point3D b = core::shapes::ambientDrift(inputAt({-400.0f, 250.0f, 90.0f}, 1.5f), particle);
    EXPECT_FLOAT_EQ(a.x, b.x);
    EXPECT_FLOAT_EQ(a.y, b.y);
    EXPECT_FLOAT_EQ(a.z, b.z);
}

TEST(RingedPlanet, MembershipBoundary) {
    EXPECT_FALSE(core::shapes::isRingMember(0.0f));
    EXPECT_FALSE(core::shapes::isRingMember(0.29f));
    EXPECT_TRUE(core::shapes::isRingMember(0.3f));
    EXPECT_TRUE(core::shapes::isRingMember(0.31f));
    EXPECT_TRUE(core::shapes::isRingMember(0.99f));
}

TEST(RingedPlanet, RingParticlesLieOnFlattenedEllipse) {
    Point3D hand{50.0f, -20.0f, 10.0f};
    for (float r0 : {0.0f, 0.2f, 0.5f, 0.9f}) {
        Point3D target = core::shapes::ringedPlanet(inputAt(hand, 2.5f), particleWith(r0, 0.5f, 0.5f, 0.31f));
        float radius = 120.0f + r0 * 80.0f;

        float dx = target.x - hand.x;
        float dy = target.y - hand.y;
        float dz = target.z - hand.z;

        // x = cos a * R, z = sin a * R * 0.5, y = sin a * R * 0.2
        EXPECT_NEAR(dx * dx + (2.0f * dz) * (2.0f * dz), radius * radius, radius * radius * 1e-4f);
        EXPECT_NEAR(dy, dz * 0.4f, 1e-3f);
    }
}

TEST(RingedPlanet, PlanetParticlesStayWithinSixty) {
    Point3D hand{-100.0f, 80.0f, 0.0f};
    for (float r0 : {0.0f, 0.4f, 0.99f}) {
        for (float r3 : {0.0f, 0.15f, 0.29f}) {
            Point3D target = core::shapes::ringedPlanet(inputAt(hand, 1.0f), particleWith(r0, 0.2f, 0.8f, r3));
            EXPECT_NEAR(distance(target, hand), r0 * 60.0f, 1e-3f);
        }
    }
}

TEST(CoreHalo, MembershipBoundary) {
    EXPECT_FALSE(core::shapes::isCoreMember(0.29f));
    EXPECT_TRUE(core::shapes::isCoreMember(0.3f));
    EXPECT_TRUE(core::shapes::isCoreMember(0.31f));
}

TEST(CoreHalo, CoreParticlesStayWithinFifty) {
    Point3D hand{10.0f, 10.0f, 10.0f};
    for (float r0 : {0.0f, 0.5f, 0.99f}) {
        Point3D target = core::shapes::coreHalo(inputAt(hand, 4.0f), particleWith(r0, 0.1f, 0.1f, 0.31f));
        EXPECT_NEAR(distance(target, hand), r0 * 50.0f, 1e-3f);
    }
}

TEST(CoreHalo, WanderersOrbitFarOut) {
    Point3D hand{0.0f, 0.0f, 0.0f};
    // r2 chosen so that angle is 0 at t = 0
    Point3D target = core::shapes::coreHalo(inputAt(hand, 0.0f), particleWith(0.5f, 0.1f, 0.0f, 0.29f));
    EXPECT_NEAR(target.x, 300.0f, 1e-3f);
    EXPECT_NEAR(target.y, 0.0f, 1e-3f);
    EXPECT_LE(std::abs(target.z), 100.0f + 1e-3f);
}

TEST(TextSlots, SevenSlotsFromOffset) {
    EXPECT_EQ(core::shapes::textSlot(0.0f), 0);
    EXPECT_EQ(core::shapes::textSlot(0.14f), 0);
    EXPECT_EQ(core::shapes::textSlot(0.5f), 3);
    EXPECT_EQ(core::shapes::textSlot(0.999f), 6);
}

TEST(TextSlots, SlotCentresSpacedAroundHand) {
    Point3D hand{100.0f, 0.0f, 0.0f};
    for (float r0 : {0.05f, 0.2f, 0.5f, 0.75f, 0.95f}) {
        for (float r3 : {0.1f, 0.5f, 0.9f}) {
            Point3D target = core::shapes::textSlots(inputAt(hand, 0.8f), particleWith(r0, 0.3f, 0.3f, r3));
            float slotCentre = (static_cast<float>(core::shapes::textSlot(r0)) - 3.0f) * 40.0f;
            EXPECT_NEAR(target.x - hand.x - (r3 - 0.5f) * 30.0f, slotCentre, 1e-3f);
            EXPECT_LE(std::abs(target.y - hand.y), 35.0f + 1e-3f);
            EXPECT_LE(std::abs(target.z - hand.z), 20.0f + 1e-3f);
        }
    }
}

TEST(Heart, CurveClosesOnItself) {
    auto start = core::shapes::heartCurve(0.0f);
    auto end = core::shapes::heartCurve(6.2831853f);
    EXPECT_NEAR(start.x, end.x, 1e-3f);
    EXPECT_NEAR(start.y, end.y, 1e-3f);

    EXPECT_NEAR(start.x, 0.0f, 1e-6f);
    EXPECT_NEAR(start.y, 5.0f, 1e-5f);  // 13 - 5 - 2 - 1
}

TEST(Heart, BeatScaleOscillatesAroundFive) {
    EXPECT_FLOAT_EQ(core::shapes::heartBeatScale(0.0f), 5.0f);
    for (float t = 0.0f; t < 3.0f; t += 0.05f) {
        float s = core::shapes::heartBeatScale(t);
        EXPECT_GE(s, 4.5f - 1e-4f);
        EXPECT_LE(s, 5.5f + 1e-4f);
    }
}

TEST(Heart, TargetFollowsCurveAndHand) {
    Point3D hand{30.0f, -60.0f, 5.0f};
    Point3D target = core::shapes::heart(inputAt(hand, 0.0f), particleWith(0.0f, 0.5f, 0.5f, 0.5f));

    // theta = 0: curve (0, 5), scale 5, depth sin(0) = 0
    EXPECT_NEAR(target.x, hand.x, 1e-4f);
    EXPECT_NEAR(target.y, hand.y - 25.0f + 20.0f, 1e-4f);
    EXPECT_NEAR(target.z, hand.z, 1e-4f);
}
