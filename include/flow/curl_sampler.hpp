#pragma once
// -----------------------------------------------------------------------------
// curl_sampler.hpp
//
// Divergence-free velocity field built as the curl of a noise potential.
//
// Three noise fields (psi1, psi2, psi3) are evaluated at the same point. Each
// one uses a different lattice shift, so a single hash yields three
// independent potentials. The velocity is
//
//     v = curl(psi) = ( d psi3/dy - d psi2/dz,
//                       d psi1/dz - d psi3/dx,
//                       d psi2/dx - d psi1/dy )
//
// and div(curl(psi)) = 0 identically for a C2 potential. No extra step is
// needed to cancel divergence. What remains is float rounding.
//
// Every sample also builds a local orthonormal frame around the velocity. The
// frame construction is a policy type so the strategy can be swapped without
// touching the integrator or the kernel.
// -----------------------------------------------------------------------------

#include <glm/glm.hpp>

#include "flow/host_device.hpp"
#include "flow/noise_field.hpp"

namespace flow {

// Orthonormal basis at a streamline point.
struct Frame {
    glm::vec3 normal;
    glm::vec3 binormal;
    glm::vec3 tangent;
};

struct CurlSample {
    glm::vec3 velocity;  // raw curl vector, used as the integration step direction
    Frame frame;
};

// Time-dependent field parameters, passed explicitly to every sampling call.
struct FieldParams {
    glm::vec3 timeOffset;  // added to the scaled position, drifts the field over time
    float scale;           // world-to-noise frequency
};

// Below this velocity magnitude the tangent is treated as undefined.
constexpr float kDegenerateVelocity = 1e-8f;
// Below this |tangent x up| the up reference is treated as parallel.
constexpr float kParallelThreshold = 1e-3f;

FLOW_HD inline glm::vec3 worldUp() { return glm::vec3(0.0f, 1.0f, 0.0f); }
FLOW_HD inline glm::vec3 fallbackAxis() { return glm::vec3(1.0f, 0.0f, 0.0f); }

// Lattice shifts that decorrelate the three potential components.
FLOW_HD inline glm::ivec3 potentialShift(int component) {
    switch (component) {
        case 1: return glm::ivec3(131, -57, 211);
        case 2: return glm::ivec3(-173, 239, 97);
        default: return glm::ivec3(0, 0, 0);
    }
}

// -----------------------------------------------------------------------------
// UpReferenceFrame
// normal   = normalize(tangent x up), with a fallback axis near +/-up
// binormal = normal x tangent
// A zero-length velocity takes the world up direction as its tangent. The
// result is always a valid basis. Near-vertical tangents twist visibly
// between consecutive samples.
// -----------------------------------------------------------------------------
struct UpReferenceFrame {
    FLOW_HD static Frame build(const glm::vec3& velocity) {
        const float speed = glm::length(velocity);
        const glm::vec3 t = speed > kDegenerateVelocity ? velocity / speed : worldUp();

        glm::vec3 n = glm::cross(t, worldUp());
        if (glm::length(n) < kParallelThreshold) {
            n = glm::cross(t, fallbackAxis());
        }
        n = glm::normalize(n);

        Frame frame;
        frame.tangent = t;
        frame.normal = n;
        frame.binormal = glm::cross(n, t);
        return frame;
    }
};

// -----------------------------------------------------------------------------
// sampleCurl(position, timeOffset, scale)
// Velocity and frame at a world position. Gradients are taken with respect to
// world space, so the velocity scales linearly with `scale`.
// -----------------------------------------------------------------------------
template <typename FramePolicy = UpReferenceFrame>
FLOW_HD inline CurlSample sampleCurl(const glm::vec3& position,
                                     const glm::vec3& timeOffset,
                                     float scale) {
    const glm::vec3 q = position * scale + timeOffset;

    const glm::vec3 g1 = noiseWithGradient(q, potentialShift(0)).gradient * scale;
    const glm::vec3 g2 = noiseWithGradient(q, potentialShift(1)).gradient * scale;
    const glm::vec3 g3 = noiseWithGradient(q, potentialShift(2)).gradient * scale;

    CurlSample s;
    s.velocity = glm::vec3(g3.y - g2.z,
                           g1.z - g3.x,
                           g2.x - g1.y);
    s.frame = FramePolicy::build(s.velocity);
    return s;
}

template <typename FramePolicy = UpReferenceFrame>
FLOW_HD inline CurlSample sampleCurl(const glm::vec3& position, const FieldParams& field) {
    return sampleCurl<FramePolicy>(position, field.timeOffset, field.scale);
}

}  // namespace flow
