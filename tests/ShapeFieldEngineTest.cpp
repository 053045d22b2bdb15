#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/ShapeFieldEngine.hpp"

using core::Gesture;
using core::Point3D;
using core::ShapeFieldEngine;
using core::SimulationContext;

namespace {

SimulationContext contextFor(Gesture gesture, Point3D anchor = {}, float elapsed = 1.0f) {
    SimulationContext ctx;
    ctx.gesture = gesture;
    ctx.anchor = anchor;
    ctx.elapsed = elapsed;
    return ctx;
}

float distance(const Point3D& a, const Point3D& b) {
    float dx = a.x - b.x, dy = a.y - b.y, dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

// Hue of a fully saturated color, in [0, 1)
float hueOf(const Point3D& rgb) {
    float maxC = std::max({rgb.x, rgb.y, rgb.z});
    float minC = std::min({rgb.x, rgb.y, rgb.z});
    float d = maxC - minC;
    if (d <= 0.0f) return 0.0f;

    float h;
    if (maxC == rgb.x) {
        h = (rgb.y - rgb.z) / d + (rgb.y < rgb.z ? 6.0f : 0.0f);
    } else if (maxC == rgb.y) {
        h = (rgb.z - rgb.x) / d + 2.0f;
    } else {
        h = (rgb.x - rgb.y) / d + 4.0f;
    }
    return h / 6.0f;
}

float hueDistance(float a, float b) {
    float d = std::abs(a - b);
    return std::min(d, 1.0f - d);
}

} // namespace

TEST(ShapeFieldEngine, ColorStride) {
    EXPECT_EQ(ShapeFieldEngine::colorStride(4000), 13u);
    EXPECT_EQ(ShapeFieldEngine::colorStride(2000), 6u);
    EXPECT_EQ(ShapeFieldEngine::colorStride(600), 2u);
    EXPECT_EQ(ShapeFieldEngine::colorStride(300), 1u);
    EXPECT_EQ(ShapeFieldEngine::colorStride(100), 1u);
    EXPECT_EQ(ShapeFieldEngine::colorStride(1), 1u);
}

TEST(ShapeFieldEngine, InitialSetMatchesCountAndRanges) {
    ShapeFieldEngine engine(2000, 42);
    const auto& particles = engine.particles();

    ASSERT_EQ(particles.size(), 2000u);
    EXPECT_EQ(particles.renderPositions().size(), 6000u);
    EXPECT_EQ(particles.colors().size(), 6000u);
    EXPECT_EQ(particles.sizes().size(), 2000u);

    for (size_t i = 0; i < particles.size(); ++i) {
        Point3D base = particles.basePosition(i);
        EXPECT_GE(base.x, -500.0f);
        EXPECT_LT(base.x, 500.0f);
        EXPECT_GE(base.z, -500.0f);
        EXPECT_LT(base.z, 500.0f);

        EXPECT_GE(particles.particleSize(i), 1.0f);
        EXPECT_LT(particles.particleSize(i), 4.0f);

        // Cyan default band
        float hue = hueOf(particles.baseColor(i));
        EXPECT_GE(hue, 0.5f - 1e-3f);
        EXPECT_LE(hue, 0.6f + 1e-3f);
    }
}

TEST(ShapeFieldEngine, PositionsBlendTowardTarget) {
    ShapeFieldEngine engine(64, 7);
    auto ctx = contextFor(Gesture::Fist, {0.1f, 0.2f, 0.3f}, 1.0f);

    std::vector<Point3D> before;
    for (size_t i = 0; i < engine.particles().size(); ++i) {
        before.push_back(engine.particles().position(i));
    }

    engine.updatePositions(ctx);

    const auto& shape = core::shapeFor(Gesture::Fist);
    core::ShapeInput input;
    input.hand = ctx.handInScene();
    input.t = ctx.shapeTime();
    const float alpha = 0.95f * 0.1f;

    for (size_t i = 0; i < engine.particles().size(); ++i) {
        core::ShapeParticle particle{engine.particles().basePosition(i), engine.particles().randoms(i)};
        Point3D target = shape.target(input, particle);
        Point3D pos = engine.particles().position(i);

        EXPECT_NEAR(pos.x, before[i].x + (target.x - before[i].x) * alpha, 1e-3f);
        EXPECT_NEAR(pos.y, before[i].y + (target.y - before[i].y) * alpha, 1e-3f);
        EXPECT_NEAR(pos.z, before[i].z + (target.z - before[i].z) * alpha, 1e-3f);
    }
}

TEST(ShapeFieldEngine, TurbulenceOnlyReachesRenderBuffer) {
    ShapeFieldEngine engine(32, 3);
    auto ctx = contextFor(Gesture::None, {}, 0.5f);

    for (int frame = 0; frame < 3; ++frame) {
        std::vector<Point3D> before;
        for (size_t i = 0; i < engine.particles().size(); ++i) {
            before.push_back(engine.particles().position(i));
        }

        engine.updatePositions(ctx);

        const auto& shape = core::shapeFor(Gesture::None);
        core::ShapeInput input;
        input.hand = ctx.handInScene();
        input.t = ctx.shapeTime();
        const float alpha = 0.02f * 0.1f;

        for (size_t i = 0; i < engine.particles().size(); ++i) {
            auto randoms = engine.particles().randoms(i);
            Point3D target = shape.target(input, {engine.particles().basePosition(i), randoms});
            Point3D pos = engine.particles().position(i);

            // Stored state is the pure blend of the previous stored state
            EXPECT_NEAR(pos.x, before[i].x + (target.x - before[i].x) * alpha, 1e-3f);

            Point3D offset = ShapeFieldEngine::turbulence(input.t, randoms.r0);
            Point3D rendered = engine.particles().renderPosition(i);
            EXPECT_NEAR(rendered.x, pos.x + offset.x, 1e-3f);
            EXPECT_NEAR(rendered.y, pos.y + offset.y, 1e-3f);
            EXPECT_NEAR(rendered.z, pos.z + offset.z, 1e-3f);
        }

        ctx.elapsed += core::FRAME_TIME_STEP;
    }
}

TEST(ShapeFieldEngine, TurbulenceAmplitude) {
    for (float t : {0.0f, 1.0f, 7.5f}) {
        for (float r0 : {0.0f, 0.3f, 0.9f}) {
            Point3D offset = ShapeFieldEngine::turbulence(t, r0);
            EXPECT_LE(std::abs(offset.x), 2.0f + 1e-5f);
            EXPECT_LE(std::abs(offset.y), 2.0f + 1e-5f);
            EXPECT_LE(std::abs(offset.z), 2.0f + 1e-5f);
        }
    }
    Point3D atZero = ShapeFieldEngine::turbulence(0.0f, 0.0f);
    EXPECT_NEAR(atZero.x, 0.0f, 1e-6f);
    EXPECT_NEAR(atZero.y, 2.0f, 1e-6f);
}

TEST(ShapeFieldEngine, ConvergesOntoRingedPlanet) {
    ShapeFieldEngine engine(500, 99);
    auto ctx = contextFor(Gesture::Fist, {0.2f, -0.1f, 0.0f}, 0.0f);

    for (int frame = 0; frame < 400; ++frame) {
        ctx.elapsed += core::FRAME_TIME_STEP;
        engine.step(ctx);
    }

    Point3D hand = ctx.handInScene();
    for (size_t i = 0; i < engine.particles().size(); ++i) {
        // Ring radius is at most 200; the rotating target adds a small lag
        EXPECT_LT(distance(engine.particles().position(i), hand), 260.0f);
    }
}

TEST(ShapeFieldEngine, ColorRefreshTouchesEveryStrideParticle) {
    ShapeFieldEngine engine(4000, 5);
    const auto& particles = engine.particles();
    const size_t stride = ShapeFieldEngine::colorStride(particles.size());
    ASSERT_EQ(stride, 13u);

    engine.updateColors(Gesture::Metal);

    for (size_t i = 0; i < particles.size(); ++i) {
        Point3D color = particles.color(i);
        if (i % stride == 0) {
            EXPECT_LE(hueDistance(hueOf(color), 0.95f), 0.05f + 1e-3f) << "particle " << i;
        } else {
            Point3D base = particles.baseColor(i);
            EXPECT_FLOAT_EQ(color.x, base.x);
            EXPECT_FLOAT_EQ(color.y, base.y);
            EXPECT_FLOAT_EQ(color.z, base.z);
        }
    }
}

TEST(ShapeFieldEngine, EachGestureUsesItsPalette) {
    const Gesture gestures[] = {Gesture::None, Gesture::Fist, Gesture::Open, Gesture::Peace, Gesture::Metal};
    for (Gesture gesture : gestures) {
        ShapeFieldEngine engine(900, 17);
        engine.updateColors(gesture);

        const auto& palette = core::shapeFor(gesture).palette;
        for (size_t i = 0; i < engine.particles().size(); i += ShapeFieldEngine::colorStride(900)) {
            float hue = hueOf(engine.particles().color(i));
            EXPECT_LE(hueDistance(hue, palette.base), palette.range * 0.5f + 1e-3f);
        }
    }
}

TEST(ShapeFieldEngine, SameSeedSameRun) {
    ShapeFieldEngine a(300, 1234);
    ShapeFieldEngine b(300, 1234);

    auto ctx = contextFor(Gesture::Open, {0.3f, 0.1f, -0.2f}, 0.0f);
    for (int frame = 0; frame < 20; ++frame) {
        ctx.elapsed += core::FRAME_TIME_STEP;
        if (frame == 10) ctx.gesture = Gesture::Peace;
        a.step(ctx);
        b.step(ctx);
    }

    EXPECT_EQ(a.particles().renderPositions(), b.particles().renderPositions());
    EXPECT_EQ(a.particles().colors(), b.particles().colors());
}

TEST(ShapeFieldEngine, DifferentSeedsDiffer) {
    ShapeFieldEngine a(100, 1);
    ShapeFieldEngine b(100, 2);
    EXPECT_NE(a.particles().randomsBuffer(), b.particles().randomsBuffer());
}

TEST(ShapeFieldEngine, UnknownGestureBehavesLikeIdle) {
    ShapeFieldEngine idle(200, 77);
    ShapeFieldEngine unknown(200, 77);

    auto idleCtx = contextFor(Gesture::None, {0.5f, 0.5f, 0.0f});
    auto unknownCtx = contextFor(static_cast<Gesture>(9), {0.5f, 0.5f, 0.0f});

    for (int frame = 0; frame < 5; ++frame) {
        idle.step(idleCtx);
        unknown.step(unknownCtx);
    }

    EXPECT_EQ(idle.particles().renderPositions(), unknown.particles().renderPositions());
    EXPECT_EQ(idle.particles().colors(), unknown.particles().colors());
}

TEST(ShapeFieldEngine, ResizeRegeneratesWholeSet) {
    ShapeFieldEngine engine(4000, 11);
    engine.step(contextFor(Gesture::Fist));

    const uint64_t generation = engine.particles().generation();
    const std::vector<float> oldRandoms = engine.particles().randomsBuffer();

    ASSERT_TRUE(engine.resize(2000));

    const auto& particles = engine.particles();
    EXPECT_EQ(particles.size(), 2000u);
    EXPECT_EQ(particles.generation(), generation + 1);
    EXPECT_EQ(particles.randomsBuffer().size(), 8000u);

    size_t reused = 0;
    for (size_t i = 0; i < particles.randomsBuffer().size(); ++i) {
        float r = particles.randomsBuffer()[i];
        EXPECT_GE(r, 0.0f);
        EXPECT_LT(r, 1.0f);
        if (r == oldRandoms[i]) ++reused;
    }
    EXPECT_LT(reused, 8u);

    // Fresh set starts at its base positions
    for (size_t i = 0; i < particles.size(); ++i) {
        Point3D base = particles.basePosition(i);
        Point3D pos = particles.position(i);
        EXPECT_FLOAT_EQ(pos.x, base.x);
        EXPECT_FLOAT_EQ(pos.y, base.y);
        EXPECT_FLOAT_EQ(pos.z, base.z);
        EXPECT_GE(base.y, -500.0f);
        EXPECT_LT(base.y, 500.0f);
    }
}

TEST(ShapeFieldEngine, ResizeToSameCountStillRegenerates) {
    ShapeFieldEngine engine(500, 8);
    const std::vector<float> oldRandoms = engine.particles().randomsBuffer();

    ASSERT_TRUE(engine.resize(500));

    EXPECT_EQ(engine.particles().size(), 500u);
    EXPECT_EQ(engine.particles().generation(), 2u);
    EXPECT_NE(engine.particles().randomsBuffer(), oldRandoms);
}

TEST(ShapeFieldEngine, ResizeToZeroIsRejected) {
    ShapeFieldEngine engine(300, 8);
    const uint64_t generation = engine.particles().generation();

    EXPECT_FALSE(engine.resize(0));
    EXPECT_EQ(engine.particles().size(), 300u);
    EXPECT_EQ(engine.particles().generation(), generation);
}

TEST(ParticleCount, DependsOnViewportWidth) {
    EXPECT_EQ(core::particleCountForViewport(375), 2000u);
    EXPECT_EQ(core::particleCountForViewport(767), 2000u);
    EXPECT_EQ(core::particleCountForViewport(768), 4000u);
    EXPECT_EQ(core::particleCountForViewport(1920), 4000u);
}
