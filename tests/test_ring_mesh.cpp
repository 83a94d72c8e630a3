// tests/test_ring_mesh.cpp
// -----------------------------------------------------------------------------
// Shared tube profile mesh.
// -----------------------------------------------------------------------------

#include <catch2/catch_test_macros.hpp>

#include <cmath>

#include "flow/ring_mesh.hpp"

using namespace flow;

TEST_CASE("Ring mesh vertex and index counts", "[mesh]") {
    for (int sides : {3, 8, 12, 64}) {
        const RingMesh mesh = buildRingMesh(sides);
        INFO("sides = " << sides);
        REQUIRE(mesh.vertices.size() == 2 * static_cast<size_t>(sides + 1));
        REQUIRE(mesh.indices.size() == 6 * static_cast<size_t>(sides));
        for (uint32_t index : mesh.indices) REQUIRE(index < mesh.vertices.size());
    }
}

TEST_CASE("Ring mesh vertices lie on the unit profile", "[mesh]") {
    const RingMesh mesh = buildRingMesh(8);

    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        const glm::vec3& v = mesh.vertices[i];
        REQUIRE(std::fabs(std::sqrt(v.x * v.x + v.y * v.y) - 1.0f) < 1e-6f);
        REQUIRE(v.z == (i % 2 == 0 ? 0.0f : 1.0f));
    }

    SECTION("seam column duplicates the first column") {
        const size_t n = mesh.vertices.size();
        REQUIRE(mesh.vertices[n - 2] == mesh.vertices[0]);
        REQUIRE(mesh.vertices[n - 1] == mesh.vertices[1]);
    }
}

TEST_CASE("Every quad spans both ends of the tube", "[mesh]") {
    const RingMesh mesh = buildRingMesh(6);
    for (size_t t = 0; t < mesh.indices.size(); t += 3) {
        bool start = false, end = false;
        for (size_t k = 0; k < 3; ++k) {
            const float z = mesh.vertices[mesh.indices[t + k]].z;
            start = start || z == 0.0f;
            end = end || z == 1.0f;
        }
        REQUIRE(start);
        REQUIRE(end);
    }
}

TEST_CASE("Fewer than three sides gives an empty mesh", "[mesh]") {
    for (int sides : {-1, 0, 1, 2}) {
        const RingMesh mesh = buildRingMesh(sides);
        REQUIRE(mesh.vertices.empty());
        REQUIRE(mesh.indices.empty());
    }
}
