#pragma once
// -----------------------------------------------------------------------------
// streamline.hpp
//
// Fixed-step forward Euler integration through the curl field.
//
//     p[k+1] = p[k] + stepSize * v(p[k])
//
// The frame is rebuilt from the field at every new point rather than carried
// along. The step count is fixed per configuration: no early exit and no
// adaptive refinement. The loop has no data-dependent branches, and point k+1
// depends only on point k and the field parameters.
//
// Single precision throughout. Drift accumulates over the (short, fixed)
// strand length and is not corrected.
// -----------------------------------------------------------------------------

#include <vector>

#include <glm/glm.hpp>

#include "flow/curl_sampler.hpp"
#include "flow/host_device.hpp"
#include "flow/layout.hpp"

namespace flow {

struct StreamlinePoint {
    glm::vec3 position;
    Frame frame;
    glm::vec3 velocity;
};

// Per-strand appearance written into every Segment.
struct SegmentStyle {
    glm::vec4 baseColor;
    float radius;
    float tint;  // 0 = base color only, 1 = |tangent| direction color only
};

FLOW_HD inline StreamlinePoint makePoint(const glm::vec3& position, const FieldParams& field) {
    const CurlSample s = sampleCurl(position, field);
    StreamlinePoint point;
    point.position = position;
    point.frame = s.frame;
    point.velocity = s.velocity;
    return point;
}

FLOW_HD inline StreamlinePoint advance(const StreamlinePoint& point, float stepSize, const FieldParams& field) {
    return makePoint(point.position + stepSize * point.velocity, field);
}

// -----------------------------------------------------------------------------
// makeSegment(a, b, style)
// Copies both endpoints verbatim so consecutive segments share bit-identical
// end/start values. Color depends only on `a`.
// -----------------------------------------------------------------------------
FLOW_HD inline Segment makeSegment(const StreamlinePoint& a, const StreamlinePoint& b, const SegmentStyle& style) {
    Segment s;
    s.startPosition = glm::vec4(a.position, 1.0f);
    s.startNormal = glm::vec4(a.frame.normal, 0.0f);
    s.startBitangent = glm::vec4(a.frame.binormal, 0.0f);
    s.endPosition = glm::vec4(b.position, 1.0f);
    s.endNormal = glm::vec4(b.frame.normal, 0.0f);
    s.endBitangent = glm::vec4(b.frame.binormal, 0.0f);

    const glm::vec3 direction = glm::abs(a.frame.tangent);
    const glm::vec3 rgb = glm::mix(glm::vec3(style.baseColor), direction, style.tint);
    s.color = glm::vec4(rgb, style.baseColor.a);
    s.radius = style.radius;
    s._pad[0] = 0.0f;
    s._pad[1] = 0.0f;
    s._pad[2] = 0.0f;
    return s;
}

// -----------------------------------------------------------------------------
// integrateStrand(seed, steps, stepSize, field, style, out)
// Writes exactly `steps` segments to out[0 .. steps-1] (steps + 1 points).
// -----------------------------------------------------------------------------
FLOW_HD inline void integrateStrand(const glm::vec3& seed, int steps, float stepSize,
                                    const FieldParams& field, const SegmentStyle& style,
                                    Segment* out) {
    StreamlinePoint current = makePoint(seed, field);
    for (int k = 0; k < steps; ++k) {
        const StreamlinePoint next = advance(current, stepSize, field);
        out[k] = makeSegment(current, next, style);
        current = next;
    }
}

// Host conveniences over the same device-side code.

// The steps + 1 points of one streamline.
std::vector<StreamlinePoint> trace(const glm::vec3& seed, int steps, float stepSize, const FieldParams& field);

// The `steps` segments of one strand.
std::vector<Segment> integrate(const glm::vec3& seed, int steps, float stepSize,
                               const FieldParams& field, const SegmentStyle& style);

}  // namespace flow
