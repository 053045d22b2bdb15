#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/ParticleSet.hpp"
#include "core/SimulationContext.hpp"

namespace render {

/**
 * Software preview of the particle buffers (OpenCV).
 *
 * Perspective camera (fov 75, z = 500) that eases toward the hand anchor,
 * a rotating starfield backdrop and a status overlay. Optional video output.
 * This is a debugging view; the real renderer consumes the same buffers.
 */
class PreviewRenderer {
public:
    struct Status {
        float fps = 0.0f;
        bool forced = false;
        float overrideRemaining = 0.0f;
        std::string source;
    };

    PreviewRenderer(int width, int height, uint64_t seed);
    ~PreviewRenderer();

    /**
     * Draw one frame (also written to the video file if recording)
     */
    const cv::Mat& render(const core::ParticleSet& particles, const core::SimulationContext& ctx,
                          const Status& status);

    /**
     * @return false if the writer could not be opened (logged, preview keeps running)
     */
    bool openRecorder(const std::string& path, double fps);

    /**
     * Show the last frame and poll the keyboard.
     * @return key code, -1 if none
     */
    int show(int delayMs = 1);

private:
    struct Camera {
        float x = 0.0f;
        float y = 0.0f;
        float z = 500.0f;
    };

    void updateCamera(const core::Point3D& anchor);
    bool project(float x, float y, float z, cv::Point& pixel, float& depth) const;
    void drawStarfield(float elapsed);
    void drawParticles(const core::ParticleSet& particles);
    void drawOverlay(const core::SimulationContext& ctx, const Status& status, size_t particleCount);

    int width_;
    int height_;
    float focal_;
    Camera camera_;

    cv::Mat frame_;
    cv::VideoWriter writer_;
    bool windowOpen_ = false;

    std::vector<core::Point3D> stars_;
    std::vector<float> starSizes_;
    std::vector<float> starOpacity_;
    float starRotation_ = 0.0f;
};

} // namespace render
