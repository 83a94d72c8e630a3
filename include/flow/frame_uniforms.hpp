#pragma once
// -----------------------------------------------------------------------------
// frame_uniforms.hpp
//
// Builds the per-frame parameter block from configuration and time, and
// unpacks the views of it that the compute stage consumes. Nothing here keeps
// state between frames: a frame is a pure function of (config, time).
// -----------------------------------------------------------------------------

#include "flow/config.hpp"
#include "flow/curl_sampler.hpp"
#include "flow/host_device.hpp"
#include "flow/layout.hpp"
#include "flow/streamline.hpp"
#include "flow/strand_grid.hpp"

namespace flow {

FrameUniforms makeFrameUniforms(const AppConfig& config, float timeSeconds, float aspect);

FLOW_HD inline FieldParams fieldParams(const FrameUniforms& u) {
    FieldParams field;
    field.timeOffset = glm::vec3(u.timeOffset);
    field.scale = u.noiseScale;
    return field;
}

FLOW_HD inline SegmentStyle segmentStyle(const FrameUniforms& u) {
    SegmentStyle style;
    style.baseColor = u.baseColor;
    style.radius = u.tubeRadius;
    style.tint = u.colorTint;
    return style;
}

FLOW_HD inline StrandGrid strandGrid(const FrameUniforms& u) {
    return StrandGrid{u.strandGrid.x, u.strandGrid.y, u.strandGrid.z};
}

FLOW_HD inline SeedLayout seedLayout(const FrameUniforms& u) {
    return SeedLayout{u.seedLayout.x, u.seedLayout.y, u.seedLayout.z};
}

}  // namespace flow
