#pragma once
// -----------------------------------------------------------------------------
// ring_mesh.hpp
//
// The one mesh every tube instance shares: an open cylinder of `sides` faces
// in profile space. Vertex (cos t, sin t, z) with z = 0 at the segment start
// and z = 1 at its end. The vertex shader turns (x, y) into an offset along
// the instance's interpolated normal/bitangent and z into the blend factor
// between its endpoints.
// -----------------------------------------------------------------------------

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace flow {

struct RingMesh {
    std::vector<glm::vec3> vertices;
    std::vector<uint32_t> indices;
};

// 2 * (sides + 1) vertices (seam column duplicated), 6 * sides indices.
// Returns an empty mesh for fewer than 3 sides.
RingMesh buildRingMesh(int sides);

}  // namespace flow
