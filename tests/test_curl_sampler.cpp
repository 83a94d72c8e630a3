// tests/test_curl_sampler.cpp
// -----------------------------------------------------------------------------
// Curl field: divergence, determinism, continuity, frames.
// -----------------------------------------------------------------------------

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

#include "flow/curl_sampler.hpp"

using namespace flow;

namespace {

// Deterministic spread of points over a few lattice cells.
std::vector<glm::vec3> samplePoints() {
    std::vector<glm::vec3> points;
    for (int i = 0; i < 8; ++i) {
        for (int j = 0; j < 8; ++j) {
            for (int k = 0; k < 8; ++k) {
                points.push_back(glm::vec3(-2.9f + 0.731f * static_cast<float>(i),
                                           -3.3f + 0.817f * static_cast<float>(j),
                                           -2.2f + 0.593f * static_cast<float>(k)));
            }
        }
    }
    return points;
}

glm::vec3 velocity(const glm::vec3& p, const glm::vec3& offset, float scale) {
    return sampleCurl(p, offset, scale).velocity;
}

// Fourth-order central differences, so the truncation error stays well
// below the bound being checked.
float divergence(const glm::vec3& p, const glm::vec3& offset, float scale, float h) {
    float sum = 0.0f;
    for (int axis = 0; axis < 3; ++axis) {
        glm::vec3 e(0.0f);
        e[axis] = h;
        const float d = -velocity(p + 2.0f * e, offset, scale)[axis] + 8.0f * velocity(p + e, offset, scale)[axis] -
                        8.0f * velocity(p - e, offset, scale)[axis] + velocity(p - 2.0f * e, offset, scale)[axis];
        sum += d / (12.0f * h);
    }
    return sum;
}

// 40^3 points over the same region, for the worst-case bound.
std::vector<glm::vec3> densePoints() {
    std::vector<glm::vec3> points;
    points.reserve(40 * 40 * 40);
    for (int i = 0; i < 40; ++i) {
        for (int j = 0; j < 40; ++j) {
            for (int k = 0; k < 40; ++k) {
                points.push_back(glm::vec3(-2.9f + 0.1301f * static_cast<float>(i),
                                           -3.3f + 0.1427f * static_cast<float>(j),
                                           -2.2f + 0.1049f * static_cast<float>(k)));
            }
        }
    }
    return points;
}

void requireOrthonormal(const Frame& f) {
    const float tol = 1e-5f;
    REQUIRE(std::fabs(glm::length(f.normal) - 1.0f) < tol);
    REQUIRE(std::fabs(glm::length(f.binormal) - 1.0f) < tol);
    REQUIRE(std::fabs(glm::length(f.tangent) - 1.0f) < tol);
    REQUIRE(std::fabs(glm::dot(f.normal, f.binormal)) < tol);
    REQUIRE(std::fabs(glm::dot(f.normal, f.tangent)) < tol);
    REQUIRE(std::fabs(glm::dot(f.binormal, f.tangent)) < tol);
}

// Frame strategy that ignores the velocity entirely.
struct AxisAlignedFrame {
    static Frame build(const glm::vec3&) {
        Frame f;
        f.normal = glm::vec3(1.0f, 0.0f, 0.0f);
        f.binormal = glm::vec3(0.0f, 1.0f, 0.0f);
        f.tangent = glm::vec3(0.0f, 0.0f, 1.0f);
        return f;
    }
};

}  // namespace

TEST_CASE("Curl field is approximately divergence-free", "[curl]") {
    const float h = 1e-2f;
    float maxDiv = 0.0f;
    float sumDiv = 0.0f;
    float maxSpeed = 0.0f;

    const std::vector<glm::vec3> points = samplePoints();
    for (const glm::vec3& p : points) {
        const float div = std::fabs(divergence(p, glm::vec3(0.0f), 1.0f, h));
        maxDiv = std::max(maxDiv, div);
        sumDiv += div;
        maxSpeed = std::max(maxSpeed, glm::length(velocity(p, glm::vec3(0.0f), 1.0f)));
    }

    INFO("max |div| = " << maxDiv << ", mean |div| = " << sumDiv / points.size());
    REQUIRE(maxSpeed > 0.1f);
    REQUIRE(maxDiv < 1e-3f);
    REQUIRE(sumDiv / static_cast<float>(points.size()) < 5e-4f);

    SECTION("dense sweep stays under the bound") {
        float denseMax = 0.0f;
        for (const glm::vec3& p : densePoints()) {
            denseMax = std::max(denseMax, std::fabs(divergence(p, glm::vec3(0.0f), 1.0f, h)));
        }
        INFO("dense max |div| = " << denseMax);
        REQUIRE(denseMax < 1e-3f);
    }
}

TEST_CASE("Curl field stays divergence-free with a time offset", "[curl]") {
    const glm::vec3 offset(0.0f, 0.0f, 0.75f);
    for (const glm::vec3& p : samplePoints()) {
        REQUIRE(std::fabs(divergence(p, offset, 1.0f, 1e-2f)) < 1e-3f);
    }
}

TEST_CASE("Curl samples are bit-identical for identical arguments", "[curl]") {
    const glm::vec3 p(0.31f, -0.72f, 1.05f);
    const glm::vec3 offset(0.1f, 0.2f, 0.3f);

    const CurlSample a = sampleCurl(p, offset, 0.5f);
    const CurlSample b = sampleCurl(p, offset, 0.5f);
    REQUIRE(a.velocity == b.velocity);
    REQUIRE(a.frame.normal == b.frame.normal);
    REQUIRE(a.frame.binormal == b.frame.binormal);
    REQUIRE(a.frame.tangent == b.frame.tangent);

    SECTION("FieldParams overload reads the same field") {
        FieldParams field;
        field.timeOffset = offset;
        field.scale = 0.5f;
        REQUIRE(sampleCurl(p, field).velocity == a.velocity);
    }

    SECTION("time offset changes the field") {
        REQUIRE(sampleCurl(p, offset + glm::vec3(0.0f, 0.0f, 0.5f), 0.5f).velocity != a.velocity);
    }
}

TEST_CASE("Curl field is Lipschitz continuous", "[curl]") {
    const float step = 1e-3f;
    const glm::vec3 directions[] = {
        glm::vec3(1.0f, 0.0f, 0.0f),
        glm::vec3(0.0f, 1.0f, 0.0f),
        glm::vec3(0.0f, 0.0f, 1.0f),
        glm::normalize(glm::vec3(1.0f, -1.0f, 1.0f)),
    };

    for (const glm::vec3& p : samplePoints()) {
        const glm::vec3 v = velocity(p, glm::vec3(0.0f), 1.0f);
        for (const glm::vec3& d : directions) {
            const glm::vec3 delta = d * step;
            const float change = glm::length(velocity(p + delta, glm::vec3(0.0f), 1.0f) - v);
            REQUIRE(change <= 40.0f * glm::length(delta));
        }
    }
}

TEST_CASE("Sampled frames are orthonormal", "[curl][frame]") {
    for (const glm::vec3& p : samplePoints()) {
        const CurlSample s = sampleCurl(p, glm::vec3(0.0f), 0.5f);
        requireOrthonormal(s.frame);

        const float speed = glm::length(s.velocity);
        if (speed > kDegenerateVelocity) {
            REQUIRE(glm::length(s.frame.tangent - s.velocity / speed) < 1e-5f);
        }
    }
}

TEST_CASE("Degenerate tangents fall back to a valid frame", "[curl][frame]") {
    SECTION("zero velocity uses world up as tangent") {
        const Frame f = UpReferenceFrame::build(glm::vec3(0.0f));
        requireOrthonormal(f);
        REQUIRE(f.tangent == worldUp());
    }

    SECTION("velocity parallel to up") {
        requireOrthonormal(UpReferenceFrame::build(glm::vec3(0.0f, 5.0f, 0.0f)));
        requireOrthonormal(UpReferenceFrame::build(glm::vec3(0.0f, -2.0f, 0.0f)));
    }

    SECTION("velocity nearly parallel to up") {
        const Frame f = UpReferenceFrame::build(glm::vec3(1e-5f, 1.0f, -2e-5f));
        requireOrthonormal(f);
        REQUIRE(std::fabs(glm::dot(f.normal, fallbackAxis())) < 1e-3f);
    }

    SECTION("regular velocity uses the up reference") {
        const Frame f = UpReferenceFrame::build(glm::vec3(1.0f, 0.0f, 0.0f));
        requireOrthonormal(f);
        REQUIRE(std::fabs(glm::dot(f.normal, worldUp())) < 1e-6f);
        REQUIRE(glm::length(f.normal - glm::vec3(0.0f, 0.0f, 1.0f)) < 1e-6f);
    }
}

TEST_CASE("Frame strategy can be replaced without changing the field", "[curl][frame]") {
    const glm::vec3 p(0.9f, 0.1f, -0.4f);
    const CurlSample standard = sampleCurl(p, glm::vec3(0.0f), 0.5f);
    const CurlSample custom = sampleCurl<AxisAlignedFrame>(p, glm::vec3(0.0f), 0.5f);

    REQUIRE(custom.velocity == standard.velocity);
    REQUIRE(custom.frame.tangent == glm::vec3(0.0f, 0.0f, 1.0f));
}
