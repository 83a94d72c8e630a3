#pragma once
// -----------------------------------------------------------------------------
// config.hpp
//
// Everything the application can be told from outside: window size, strand
// grid, field parameters, tube appearance, light and camera. Defaults give a
// 16x16 grid of 32-segment strands.
//
// Command-line overrides use the --key=value form, e.g.
//     curlflow --grid-x=32 --grid-y=32 --segments=64 --scale=0.8
// Vector values are comma separated: --color=0.9,0.5,0.2
// -----------------------------------------------------------------------------

#include <iosfwd>
#include <string>

#include <glm/glm.hpp>

#include "flow/strand_grid.hpp"

namespace flow {

struct AppConfig {
    // Window / color target
    int width = 1280;
    int height = 720;

    // Strand grid
    StrandGrid grid{16, 16, 32};
    SeedLayout seeds{2.0f, 0.0f, 0.0f};

    // Field
    float noiseScale = 0.5f;
    float stepSize = 0.05f;
    glm::vec3 drift{0.0f, 0.0f, 0.15f};  // time offset per second

    // Tubes
    float radius = 0.012f;
    float tint = 0.35f;
    int ringSides = 8;
    glm::vec4 baseColor{0.95f, 0.55f, 0.25f, 1.0f};

    // Lighting
    glm::vec3 lightDirection{-0.4f, -1.0f, -0.3f};
    glm::vec3 lightColor{1.0f, 0.97f, 0.92f};
    glm::vec3 ambientColor{0.12f, 0.13f, 0.16f};

    // Camera
    glm::vec3 eye{0.0f, 0.4f, 3.2f};
    glm::vec3 target{0.0f, 0.0f, 0.0f};
    float fovDegrees = 50.0f;

    // Runtime
    int frames = 0;        // 0 = run until the window closes
    int cpuThreads = 0;    // 0 = hardware concurrency
    bool forceCpu = false;
    bool showHelp = false;
    std::string shaderDir;
};

// -----------------------------------------------------------------------------
// parseArgs(argc, argv, config, error)
// Applies --key=value overrides on top of `config`. Returns false and fills
// `error` on an unknown key or a malformed value.
// -----------------------------------------------------------------------------
bool parseArgs(int argc, char** argv, AppConfig& config, std::string& error);

// -----------------------------------------------------------------------------
// validateConfig(config, error)
// Range checks. A failure here is a configuration error: fatal, no retry.
// -----------------------------------------------------------------------------
bool validateConfig(const AppConfig& config, std::string& error);

void printUsage(std::ostream& out, const char* program);

}  // namespace flow
