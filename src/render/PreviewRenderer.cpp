#include "render/PreviewRenderer.hpp"
#include "core/GestureClassifier.hpp"
#include "core/Logger.hpp"
#include "math/Random.hpp"
#include "render/PointSize.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace render {

namespace {

constexpr float FOV_DEG = 75.0f;
constexpr float NEAR_PLANE = 0.1f;
constexpr float FAR_PLANE = 2000.0f;
constexpr size_t STAR_COUNT = 3000;
constexpr const char* WINDOW_NAME = "GestureMorph";

} // namespace

PreviewRenderer::PreviewRenderer(int width, int height, uint64_t seed)
    : width_(width), height_(height),
      focal_(static_cast<float>(height) * 0.5f / std::tan(FOV_DEG * 0.5f * static_cast<float>(CV_PI) / 180.0f)),
      frame_(height, width, CV_8UC3, cv::Scalar::all(0)) {

    // Backdrop: stars on a thick shell around the scene
    math::Random rng(seed ^ 0x5eedULL);
    stars_.reserve(STAR_COUNT);
    starSizes_.reserve(STAR_COUNT);
    starOpacity_.reserve(STAR_COUNT);
    for (size_t i = 0; i < STAR_COUNT; ++i) {
        float r = 800.0f + rng.uniform() * 1000.0f;
        float theta = rng.uniform() * 2.0f * static_cast<float>(CV_PI);
        float phi = std::acos(2.0f * rng.uniform() - 1.0f);
        stars_.push_back({r * std::sin(phi) * std::cos(theta),
                          r * std::sin(phi) * std::sin(theta),
                          r * std::cos(phi)});
        starSizes_.push_back(rng.uniform() * 2.0f + 0.5f);
        starOpacity_.push_back(rng.uniform());
    }
}

PreviewRenderer::~PreviewRenderer() {
    if (writer_.isOpened()) {
        writer_.release();
    }
    if (windowOpen_) {
        cv::destroyWindow(WINDOW_NAME);
    }
}

bool PreviewRenderer::openRecorder(const std::string& path, double fps) {
    try {
        writer_.open(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, cv::Size(width_, height_));
    } catch (const cv::Exception& e) {
        core::Logger::error("PreviewRenderer: failed to open video writer: ", e.what());
        return false;
    }
    if (!writer_.isOpened()) {
        core::Logger::error("PreviewRenderer: could not open '", path, "' for writing");
        return false;
    }
    core::Logger::info("PreviewRenderer: recording to ", path);
    return true;
}

const cv::Mat& PreviewRenderer::render(const core::ParticleSet& particles, const core::SimulationContext& ctx,
                                       const Status& status) {
    frame_.setTo(cv::Scalar::all(0));

    updateCamera(ctx.anchor);
    drawStarfield(ctx.elapsed);
    drawParticles(particles);
    drawOverlay(ctx, status, particles.size());

    if (writer_.isOpened()) {
        writer_.write(frame_);
    }
    return frame_;
}

int PreviewRenderer::show(int delayMs) {
    if (!windowOpen_) {
        cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);
        windowOpen_ = true;
    }
    cv::imshow(WINDOW_NAME, frame_);
    return cv::waitKey(delayMs);
}

void PreviewRenderer::updateCamera(const core::Point3D& anchor) {
    // Gentle follow: x/y track the hand, z leans in when the hand comes closer
    camera_.x += (anchor.x * 150.0f - camera_.x) * 0.05f;
    camera_.y += (anchor.y * 150.0f - camera_.y) * 0.05f;
    camera_.z += ((500.0f + anchor.z * 200.0f) - camera_.z) * 0.02f;
}

bool PreviewRenderer::project(float x, float y, float z, cv::Point& pixel, float& depth) const {
    depth = camera_.z - z;  // Camera looks down -Z
    if (depth < NEAR_PLANE || depth > FAR_PLANE) {
        return false;
    }

    float sx = static_cast<float>(width_) * 0.5f + (x - camera_.x) / depth * focal_;
    float sy = static_cast<float>(height_) * 0.5f - (y - camera_.y) / depth * focal_;
    if (sx < 0.0f || sy < 0.0f || sx >= static_cast<float>(width_) || sy >= static_cast<float>(height_)) {
        return false;
    }

    pixel = cv::Point(static_cast<int>(sx), static_cast<int>(sy));
    return true;
}

void PreviewRenderer::drawStarfield(float elapsed) {
    starRotation_ += 0.0002f;
    const float c = std::cos(starRotation_);
    const float s = std::sin(starRotation_);

    for (size_t i = 0; i < stars_.size(); ++i) {
        const auto& star = stars_[i];
        // Rotation about Y
        float x = star.x * c + star.z * s;
        float z = -star.x * s + star.z * c;

        cv::Point pixel;
        float depth = 0.0f;
        if (!project(x, star.y, z, pixel, depth)) continue;

        float twinkle = starOpacity_[i] * (0.5f + 0.5f * std::sin(elapsed * 2.0f + star.x * 0.01f));
        double level = 255.0 * std::clamp(twinkle, 0.0f, 1.0f);
        int radius = starRadius(starSizes_[i], depth);
        cv::circle(frame_, pixel, radius, cv::Scalar::all(level), cv::FILLED);
    }
}

void PreviewRenderer::drawParticles(const core::ParticleSet& particles) {
    const auto& positions = particles.renderPositions();
    const auto& colors = particles.colors();
    const auto& sizes = particles.sizes();

    for (size_t i = 0; i < particles.size(); ++i) {
        cv::Point pixel;
        float depth = 0.0f;
        if (!project(positions[i * 3], positions[i * 3 + 1], positions[i * 3 + 2], pixel, depth)) continue;

        int radius = particleRadius(sizes[i], depth);
        cv::Scalar bgr(colors[i * 3 + 2] * 255.0, colors[i * 3 + 1] * 255.0, colors[i * 3] * 255.0);
        cv::circle(frame_, pixel, radius, bgr, cv::FILLED, cv::LINE_AA);
    }
}

void PreviewRenderer::drawOverlay(const core::SimulationContext& ctx, const Status& status, size_t particleCount) {
    auto drawTransparentRect = [&](cv::Rect rect, cv::Scalar color, double alpha) {
        cv::Mat roi = frame_(rect & cv::Rect(0, 0, width_, height_));
        cv::Mat overlay(roi.size(), roi.type(), color);
        cv::addWeighted(overlay, alpha, roi, 1.0 - alpha, 0, roi);
    };

    drawTransparentRect(cv::Rect(5, 5, 300, 112), cv::Scalar(0, 0, 0), 0.6);

    int yPos = 25;
    std::ostringstream gestureStr;
    gestureStr << (status.forced ? "Manual: " : "Gesture: ") << core::getGestureDisplayName(ctx.gesture);
    if (status.forced) {
        gestureStr << " (" << std::fixed << std::setprecision(1) << status.overrideRemaining << "s)";
    }
    cv::Scalar gestureColor = status.forced ? cv::Scalar(0, 200, 255) : cv::Scalar(0, 255, 0);
    cv::putText(frame_, gestureStr.str(), cv::Point(12, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.55, gestureColor, 1);

    yPos += 22;
    std::ostringstream anchorStr;
    anchorStr << std::fixed << std::setprecision(2) << "Hand: " << ctx.anchor.x << ", " << ctx.anchor.y
              << ", " << ctx.anchor.z;
    cv::putText(frame_, anchorStr.str(), cv::Point(12, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(255, 255, 255), 1);

    yPos += 20;
    std::ostringstream statsStr;
    statsStr << std::fixed << std::setprecision(1) << status.fps << " fps | " << particleCount
             << " particles | " << status.source;
    cv::Scalar fpsColor = (status.fps >= 55.0f) ? cv::Scalar(0, 255, 0) :
                          (status.fps >= 30.0f) ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 0, 255);
    cv::putText(frame_, statsStr.str(), cv::Point(12, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.45, fpsColor, 1);

    yPos += 20;
    cv::putText(frame_, "Text: " + ctx.customText, cv::Point(12, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(200, 200, 255), 1);

    yPos += 20;
    cv::putText(frame_, "1-5 force  n/w resize  q quit", cv::Point(12, yPos), cv::FONT_HERSHEY_SIMPLEX, 0.4,
                cv::Scalar(160, 160, 160), 1);
}

} // namespace render
