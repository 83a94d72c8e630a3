#pragma once
// -----------------------------------------------------------------------------
// shader_schema.hpp
//
// Field tables for Segment and FrameUniforms, built with offsetof from the
// C++ declarations in layout.hpp. They are the single source for:
//   - the GLSL uniform block and per-instance inputs prepended to the shaders
//   - the attribute offsets the renderer hands to glVertexAttribPointer
//   - the startup check against the offsets the GL driver reports
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <vector>

namespace flow {

struct UniformField {
    const char* name;
    const char* glslType;
    size_t offset;
};

struct InstanceAttribute {
    const char* name;
    int components;  // float components read from the record
    size_t offset;
};

// Location of the ring profile vertex input; instance inputs follow it.
constexpr int kProfileLocation = 0;
constexpr int kFirstInstanceLocation = 1;

const std::vector<UniformField>& frameUniformSchema();
const std::vector<InstanceAttribute>& segmentAttributeSchema();

// "layout(std140) uniform FrameUniforms { ... };"
std::string glslUniformBlock();

// One "layout(location = N) in vecK name;" line per instance attribute.
std::string glslInstanceInputs();

// -----------------------------------------------------------------------------
// injectPrelude(source, prelude)
// Inserts `prelude` after the #version line of a GLSL source (or at the top
// when the source has none).
// -----------------------------------------------------------------------------
std::string injectPrelude(const std::string& source, const std::string& prelude);

}  // namespace flow
