#include "flow/frame_uniforms.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace flow {

FrameUniforms makeFrameUniforms(const AppConfig& config, float timeSeconds, float aspect) {
    FrameUniforms u{};

    u.view = glm::lookAt(config.eye, config.target, glm::vec3(0.0f, 1.0f, 0.0f));
    u.projection = glm::perspective(glm::radians(config.fovDegrees), aspect, 0.01f, 100.0f);
    u.cameraPosition = glm::vec4(config.eye, 1.0f);

    u.lightDirection = glm::vec4(glm::normalize(config.lightDirection), 0.0f);
    u.lightColor = glm::vec4(config.lightColor, 1.0f);
    u.ambientColor = glm::vec4(config.ambientColor, 1.0f);
    u.baseColor = config.baseColor;

    u.timeOffset = glm::vec4(config.drift * timeSeconds, timeSeconds);
    u.noiseScale = config.noiseScale;
    u.stepSize = config.stepSize;
    u.tubeRadius = config.radius;
    u.colorTint = config.tint;

    u.strandGrid = glm::ivec4(config.grid.width, config.grid.height,
                              config.grid.segmentsPerStrand, config.ringSides);
    u.seedLayout = glm::vec4(config.seeds.extent, config.seeds.plane, config.seeds.jitter, 0.0f);
    return u;
}

}  // namespace flow
