#include "flow/ring_mesh.hpp"

#include <cmath>

namespace flow {

RingMesh buildRingMesh(int sides) {
    RingMesh mesh;
    if (sides < 3) return mesh;

    const float twoPi = 6.28318530718f;
    mesh.vertices.reserve(2 * (static_cast<size_t>(sides) + 1));
    for (int i = 0; i <= sides; ++i) {
        // Close the seam exactly instead of trusting cos/sin at 2*pi.
        const float theta = i == sides ? 0.0f : twoPi * static_cast<float>(i) / static_cast<float>(sides);
        const float c = std::cos(theta);
        const float s = std::sin(theta);
        mesh.vertices.push_back(glm::vec3(c, s, 0.0f));
        mesh.vertices.push_back(glm::vec3(c, s, 1.0f));
    }

    mesh.indices.reserve(6 * static_cast<size_t>(sides));
    for (int i = 0; i < sides; ++i) {
        const uint32_t base = static_cast<uint32_t>(i) * 2;
        mesh.indices.push_back(base);
        mesh.indices.push_back(base + 2);
        mesh.indices.push_back(base + 1);

        mesh.indices.push_back(base + 1);
        mesh.indices.push_back(base + 2);
        mesh.indices.push_back(base + 3);
    }
    return mesh;
}

}  // namespace flow
