#pragma once
// -----------------------------------------------------------------------------
// layout.hpp
//
// The binary contract between the compute stage (which writes Segments and
// reads FrameUniforms) and the render stage (which reads both).
//
// Each 3-component vector occupies a full 16-byte vec4 slot. std140 uniform
// blocks and CUDA both align vec3 to 16 bytes, and a host vec3 is 12 bytes, so
// the explicit vec4 keeps every field at the same byte offset on all three
// sides. The GLSL declarations are generated from these structs (see
// shader_schema.hpp), so the layout is written down exactly once.
// -----------------------------------------------------------------------------

#include <cstddef>

#include <glm/glm.hpp>

namespace flow {

// -----------------------------------------------------------------------------
// Segment
// One tube instance between two consecutive streamline points. Within a
// strand, segment[i].end* and segment[i+1].start* hold the same values.
// -----------------------------------------------------------------------------
struct Segment {
    glm::vec4 startPosition;   // xyz, w = 1
    glm::vec4 startNormal;     // xyz, w = 0
    glm::vec4 startBitangent;  // xyz, w = 0
    glm::vec4 endPosition;
    glm::vec4 endNormal;
    glm::vec4 endBitangent;
    glm::vec4 color;           // rgba
    float radius;
    float _pad[3];
};

static_assert(sizeof(Segment) == 128, "Segment must be 128 bytes");
static_assert(offsetof(Segment, startNormal) == 16, "Segment vec4 slots must be 16 bytes");
static_assert(offsetof(Segment, endPosition) == 48, "Segment vec4 slots must be 16 bytes");
static_assert(offsetof(Segment, color) == 96, "Segment vec4 slots must be 16 bytes");
static_assert(offsetof(Segment, radius) == 112, "Segment radius must start a fresh slot");

// -----------------------------------------------------------------------------
// FrameUniforms
// Per-frame parameter block (std140). Read-only for both stages.
// -----------------------------------------------------------------------------
struct FrameUniforms {
    glm::mat4 view;             // offset 0
    glm::mat4 projection;       // offset 64
    glm::vec4 cameraPosition;   // offset 128
    glm::vec4 lightDirection;   // offset 144, direction light travels
    glm::vec4 lightColor;       // offset 160
    glm::vec4 ambientColor;     // offset 176
    glm::vec4 baseColor;        // offset 192
    glm::vec4 timeOffset;       // offset 208, xyz field drift, w = time in seconds
    float noiseScale;           // offset 224
    float stepSize;             // offset 228
    float tubeRadius;           // offset 232
    float colorTint;            // offset 236
    glm::ivec4 strandGrid;      // offset 240, x/y grid size, z segments per strand, w ring sides
    glm::vec4 seedLayout;       // offset 256, x extent, y plane z, z jitter
};

static_assert(sizeof(FrameUniforms) == 272, "FrameUniforms size check");
static_assert(offsetof(FrameUniforms, cameraPosition) == 128, "FrameUniforms std140 offset");
static_assert(offsetof(FrameUniforms, timeOffset) == 208, "FrameUniforms std140 offset");
static_assert(offsetof(FrameUniforms, noiseScale) == 224, "FrameUniforms std140 offset");
static_assert(offsetof(FrameUniforms, strandGrid) == 240, "FrameUniforms std140 offset");
static_assert(offsetof(FrameUniforms, seedLayout) == 256, "FrameUniforms std140 offset");

}  // namespace flow
