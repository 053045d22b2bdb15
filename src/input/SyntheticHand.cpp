#include "input/SyntheticHand.hpp"

namespace input {

namespace {

// Lays out MCP -> PIP -> DIP -> TIP for one finger
void placeFinger(core::LandmarkList& hand, int mcpIdx, float baseX, float baseY, float z,
                 bool raised, float s) {
    // Raised fingers reach well above the 0.05 margin, curled tips fold back below the base
    const float tipDy = raised ? -0.20f * s : 0.03f * s;

    hand[mcpIdx]     = {baseX, baseY, z};
    hand[mcpIdx + 1] = {baseX, baseY + tipDy * 0.40f, z - 0.01f};
    hand[mcpIdx + 2] = {baseX, baseY + tipDy * 0.70f, z - 0.02f};
    hand[mcpIdx + 3] = {baseX, baseY + tipDy, z - 0.03f};
}

} // namespace

core::LandmarkList SyntheticHand::makePose(const core::GestureClassifier::FingerState& fingers,
                                           const Placement& p) {
    using LI = core::GestureClassifier::LandmarkIndices;
    const float s = p.scale;

    core::LandmarkList hand(core::LANDMARK_COUNT);

    hand[LI::WRIST] = {p.x, p.y + 0.15f * s, p.z};

    // Thumb: CMC(1), MCP(2), IP(3), TIP(4), extends sideways
    const float thumbReach = fingers.thumb ? 0.10f * s : 0.01f * s;
    hand[1] = {p.x + 0.05f * s, p.y + 0.10f * s, p.z};
    hand[LI::THUMB_MCP] = {p.x + 0.08f * s, p.y + 0.06f * s, p.z - 0.01f};
    hand[3] = {p.x + 0.08f * s + thumbReach * 0.5f, p.y + 0.04f * s, p.z - 0.02f};
    hand[LI::THUMB_TIP] = {p.x + 0.08f * s + thumbReach, p.y + 0.02f * s, p.z - 0.03f};

    placeFinger(hand, LI::INDEX_MCP,  p.x + 0.04f * s, p.y, p.z, fingers.index, s);
    placeFinger(hand, LI::MIDDLE_MCP, p.x,             p.y, p.z, fingers.middle, s);
    placeFinger(hand, LI::RING_MCP,   p.x - 0.04f * s, p.y, p.z, fingers.ring, s);
    placeFinger(hand, LI::PINKY_MCP,  p.x - 0.08f * s, p.y + 0.01f * s, p.z, fingers.pinky, s);

    return hand;
}

core::GestureClassifier::FingerState SyntheticHand::fingersFor(core::Gesture gesture) {
    core::GestureClassifier::FingerState f;
    switch (gesture) {
        case core::Gesture::Fist:
            break;
        case core::Gesture::Open:
            f.thumb = f.index = f.middle = f.ring = f.pinky = true;
            break;
        case core::Gesture::Peace:
            f.index = f.middle = true;
            break;
        case core::Gesture::Metal:
            f.index = f.pinky = true;
            break;
        case core::Gesture::None:
        default:
            f.index = true;
            break;
    }
    return f;
}

} // namespace input
