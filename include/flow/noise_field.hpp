#pragma once
// -----------------------------------------------------------------------------
// noise_field.hpp
//
// Deterministic gradient (Perlin-style) lattice noise with an analytic
// gradient. Every function here is pure: the same input produces the same
// bits on every call, which is what lets a strand be re-traced from its seed
// every frame without storing anything.
//
// The scalar field blends, at the 8 corners of the lattice cell that contains
// the sample point, the dot product of a pseudo-random unit vector with the
// offset from that corner. Blend weights use the quintic fade
//     s(t) = 6t^5 - 15t^4 + 10t^3
// whose first and second derivatives vanish at t = 0 and t = 1, so the field
// is C2 across cell faces. The gradient returned alongside the value is the
// exact derivative of that blend, not a finite-difference estimate.
// -----------------------------------------------------------------------------

#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "flow/host_device.hpp"

namespace flow {

// Result of one noise evaluation. No identity, recomputed on every call.
struct NoiseSample {
    float value;
    glm::vec3 gradient;
};

// -----------------------------------------------------------------------------
// mixBits(h)
// 32-bit integer finalizer (xorshift-multiply). Unsigned arithmetic wraps, so
// the result is identical on host and device.
// -----------------------------------------------------------------------------
FLOW_HD inline uint32_t mixBits(uint32_t h) {
    h ^= h >> 16;
    h *= 0x7feb352du;
    h ^= h >> 15;
    h *= 0x846ca68bu;
    h ^= h >> 16;
    return h;
}

// -----------------------------------------------------------------------------
// hashLattice(c)
// Hashes an integer lattice coordinate to 32 bits. Collisions are possible and
// tolerated; only the statistical spread matters.
// -----------------------------------------------------------------------------
FLOW_HD inline uint32_t hashLattice(const glm::ivec3& c) {
    const uint32_t x = static_cast<uint32_t>(c.x) * 0x8da6b343u;
    const uint32_t y = static_cast<uint32_t>(c.y) * 0xd8163841u;
    const uint32_t z = static_cast<uint32_t>(c.z) * 0xcb1ab31fu;
    return mixBits(x ^ y ^ z);
}

// -----------------------------------------------------------------------------
// latticeGradient(c)
// Pseudo-random unit vector attached to lattice corner c. The two 16-bit
// halves of the hash pick a point uniformly on the sphere (z and azimuth).
// -----------------------------------------------------------------------------
FLOW_HD inline glm::vec3 latticeGradient(const glm::ivec3& c) {
    const uint32_t h = hashLattice(c);
    const float u = static_cast<float>(h & 0xffffu) / 65535.0f;
    const float v = static_cast<float>(h >> 16) / 65536.0f;

    const float z = 2.0f * u - 1.0f;
    const float r = sqrtf(fmaxf(0.0f, 1.0f - z * z));
    const float phi = 6.28318530718f * v;
    return glm::vec3(r * cosf(phi), r * sinf(phi), z);
}

// Quintic fade curve and its derivative.
FLOW_HD inline float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

FLOW_HD inline float fadeDerivative(float t) {
    return 30.0f * t * t * (t * (t - 2.0f) + 1.0f);
}

// -----------------------------------------------------------------------------
// noiseWithGradient(p, latticeShift)
// Evaluates the noise value and its gradient at p.
//
// latticeShift offsets the integer corner coordinates before hashing. Two
// different shifts give two statistically independent fields from the same
// hash while p itself stays small, so no float precision is spent on the
// offset.
//
// Corner naming: a=(0,0,0) b=(1,0,0) c=(0,1,0) d=(1,1,0)
//                e=(0,0,1) f=(1,0,1) g=(0,1,1) h=(1,1,1)
// -----------------------------------------------------------------------------
FLOW_HD inline NoiseSample noiseWithGradient(const glm::vec3& p,
                                             const glm::ivec3& latticeShift = glm::ivec3(0)) {
    const glm::vec3 cell(floorf(p.x), floorf(p.y), floorf(p.z));
    const glm::ivec3 i = glm::ivec3(static_cast<int>(cell.x),
                                    static_cast<int>(cell.y),
                                    static_cast<int>(cell.z)) + latticeShift;
    const glm::vec3 f = p - cell;

    const glm::vec3 u(fade(f.x), fade(f.y), fade(f.z));
    const glm::vec3 du(fadeDerivative(f.x), fadeDerivative(f.y), fadeDerivative(f.z));

    const glm::vec3 ga = latticeGradient(i + glm::ivec3(0, 0, 0));
    const glm::vec3 gb = latticeGradient(i + glm::ivec3(1, 0, 0));
    const glm::vec3 gc = latticeGradient(i + glm::ivec3(0, 1, 0));
    const glm::vec3 gd = latticeGradient(i + glm::ivec3(1, 1, 0));
    const glm::vec3 ge = latticeGradient(i + glm::ivec3(0, 0, 1));
    const glm::vec3 gf = latticeGradient(i + glm::ivec3(1, 0, 1));
    const glm::vec3 gg = latticeGradient(i + glm::ivec3(0, 1, 1));
    const glm::vec3 gh = latticeGradient(i + glm::ivec3(1, 1, 1));

    const float va = glm::dot(ga, f - glm::vec3(0.0f, 0.0f, 0.0f));
    const float vb = glm::dot(gb, f - glm::vec3(1.0f, 0.0f, 0.0f));
    const float vc = glm::dot(gc, f - glm::vec3(0.0f, 1.0f, 0.0f));
    const float vd = glm::dot(gd, f - glm::vec3(1.0f, 1.0f, 0.0f));
    const float ve = glm::dot(ge, f - glm::vec3(0.0f, 0.0f, 1.0f));
    const float vf = glm::dot(gf, f - glm::vec3(1.0f, 0.0f, 1.0f));
    const float vg = glm::dot(gg, f - glm::vec3(0.0f, 1.0f, 1.0f));
    const float vh = glm::dot(gh, f - glm::vec3(1.0f, 1.0f, 1.0f));

    // Trilinear blend expanded into monomials of u.
    const float k0 = va;
    const float k1 = vb - va;
    const float k2 = vc - va;
    const float k3 = ve - va;
    const float k4 = va - vb - vc + vd;
    const float k5 = va - vc - ve + vg;
    const float k6 = va - vb - ve + vf;
    const float k7 = -va + vb + vc - vd + ve - vf - vg + vh;

    const glm::vec3 g0 = ga;
    const glm::vec3 g1 = gb - ga;
    const glm::vec3 g2 = gc - ga;
    const glm::vec3 g3 = ge - ga;
    const glm::vec3 g4 = ga - gb - gc + gd;
    const glm::vec3 g5 = ga - gc - ge + gg;
    const glm::vec3 g6 = ga - gb - ge + gf;
    const glm::vec3 g7 = -ga + gb + gc - gd + ge - gf - gg + gh;

    NoiseSample s;
    s.value = k0 + k1 * u.x + k2 * u.y + k3 * u.z
            + k4 * u.x * u.y + k5 * u.y * u.z + k6 * u.z * u.x
            + k7 * u.x * u.y * u.z;

    s.gradient = g0 + g1 * u.x + g2 * u.y + g3 * u.z
               + g4 * (u.x * u.y) + g5 * (u.y * u.z) + g6 * (u.z * u.x)
               + g7 * (u.x * u.y * u.z)
               + du * glm::vec3(k1 + k4 * u.y + k6 * u.z + k7 * u.y * u.z,
                                k2 + k5 * u.z + k4 * u.x + k7 * u.z * u.x,
                                k3 + k6 * u.x + k5 * u.y + k7 * u.x * u.y);
    return s;
}

}  // namespace flow
