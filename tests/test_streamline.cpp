// tests/test_streamline.cpp
// -----------------------------------------------------------------------------
// Forward Euler strands and the Segment records built from them.
// -----------------------------------------------------------------------------

#include <catch2/catch_test_macros.hpp>

#include <cstring>

#include "flow/streamline.hpp"

using namespace flow;

namespace {

FieldParams testField() {
    FieldParams field;
    field.timeOffset = glm::vec3(0.0f, 0.0f, 0.15f);
    field.scale = 0.5f;
    return field;
}

SegmentStyle testStyle(float tint = 0.35f) {
    SegmentStyle style;
    style.baseColor = glm::vec4(0.95f, 0.55f, 0.25f, 1.0f);
    style.radius = 0.012f;
    style.tint = tint;
    return style;
}

const glm::vec3 kSeed(-0.4f, 0.3f, 0.0f);

}  // namespace

TEST_CASE("Each step is one forward Euler update", "[streamline]") {
    const float step = 0.05f;
    const std::vector<StreamlinePoint> points = trace(kSeed, 32, step, testField());
    REQUIRE(points.size() == 33);
    REQUIRE(points.front().position == kSeed);

    for (size_t k = 0; k + 1 < points.size(); ++k) {
        const glm::vec3 expected = points[k].position + step * points[k].velocity;
        REQUIRE(points[k + 1].position == expected);
    }
}

TEST_CASE("Frames are rebuilt from the field at every point", "[streamline]") {
    const FieldParams field = testField();
    const std::vector<StreamlinePoint> points = trace(kSeed, 16, 0.05f, field);

    for (const StreamlinePoint& point : points) {
        const CurlSample s = sampleCurl(point.position, field);
        REQUIRE(point.velocity == s.velocity);
        REQUIRE(point.frame.normal == s.frame.normal);
        REQUIRE(point.frame.binormal == s.frame.binormal);
    }
}

TEST_CASE("Consecutive segments share their endpoints exactly", "[streamline]") {
    const std::vector<Segment> segments = integrate(kSeed, 32, 0.05f, testField(), testStyle());
    REQUIRE(segments.size() == 32);

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        REQUIRE(segments[i].endPosition == segments[i + 1].startPosition);
        REQUIRE(segments[i].endNormal == segments[i + 1].startNormal);
        REQUIRE(segments[i].endBitangent == segments[i + 1].startBitangent);
    }
}

TEST_CASE("Segments match the traced points", "[streamline]") {
    const FieldParams field = testField();
    const std::vector<StreamlinePoint> points = trace(kSeed, 8, 0.05f, field);
    const std::vector<Segment> segments = integrate(kSeed, 8, 0.05f, field, testStyle());

    for (size_t i = 0; i < segments.size(); ++i) {
        REQUIRE(segments[i].startPosition == glm::vec4(points[i].position, 1.0f));
        REQUIRE(segments[i].endPosition == glm::vec4(points[i + 1].position, 1.0f));
        REQUIRE(segments[i].startNormal == glm::vec4(points[i].frame.normal, 0.0f));
        REQUIRE(segments[i].endBitangent == glm::vec4(points[i + 1].frame.binormal, 0.0f));
    }
}

TEST_CASE("Doubling the step count keeps the first half byte-identical", "[streamline]") {
    const std::vector<Segment> shortRun = integrate(kSeed, 16, 0.05f, testField(), testStyle());
    const std::vector<Segment> longRun = integrate(kSeed, 32, 0.05f, testField(), testStyle());

    REQUIRE(longRun.size() == 2 * shortRun.size());
    REQUIRE(std::memcmp(shortRun.data(), longRun.data(), shortRun.size() * sizeof(Segment)) == 0);
}

TEST_CASE("Segment style", "[streamline]") {
    SECTION("zero tint keeps the base color") {
        const std::vector<Segment> segments = integrate(kSeed, 4, 0.05f, testField(), testStyle(0.0f));
        for (const Segment& s : segments) {
            REQUIRE(s.color == glm::vec4(0.95f, 0.55f, 0.25f, 1.0f));
            REQUIRE(s.radius == 0.012f);
        }
    }

    SECTION("full tint colors by absolute tangent direction") {
        const FieldParams field = testField();
        const std::vector<StreamlinePoint> points = trace(kSeed, 4, 0.05f, field);
        const std::vector<Segment> segments = integrate(kSeed, 4, 0.05f, field, testStyle(1.0f));
        for (size_t i = 0; i < segments.size(); ++i) {
            const glm::vec3 rgb(segments[i].color);
            REQUIRE(glm::length(rgb - glm::abs(points[i].frame.tangent)) < 1e-6f);
            REQUIRE(segments[i].color.a == 1.0f);
        }
    }

    SECTION("padding is zeroed") {
        const Segment s = integrate(kSeed, 1, 0.05f, testField(), testStyle()).front();
        REQUIRE(s._pad[0] == 0.0f);
        REQUIRE(s._pad[1] == 0.0f);
        REQUIRE(s._pad[2] == 0.0f);
    }
}

TEST_CASE("Zero steps produce no segments", "[streamline]") {
    REQUIRE(integrate(kSeed, 0, 0.05f, testField(), testStyle()).empty());
    REQUIRE(trace(kSeed, 0, 0.05f, testField()).size() == 1);
}
