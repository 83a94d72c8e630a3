#include "flow/config.hpp"

#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifndef FLOW_SHADER_DIR
#define FLOW_SHADER_DIR "shaders"
#endif

namespace flow {

namespace {

float parseFloat(const std::string& text) {
    size_t used = 0;
    const float value = std::stof(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return value;
}

int parseInt(const std::string& text) {
    size_t used = 0;
    const int value = std::stoi(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return value;
}

std::vector<float> parseList(const std::string& text) {
    std::vector<float> values;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        values.push_back(parseFloat(item));
    }
    return values;
}

glm::vec3 parseVec3(const std::string& text) {
    const std::vector<float> v = parseList(text);
    if (v.size() != 3) throw std::invalid_argument(text);
    return glm::vec3(v[0], v[1], v[2]);
}

bool finite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// Applies one key. Returns false for an unknown key; throws on a bad value.
bool applyOption(AppConfig& c, const std::string& key, const std::string& value) {
    if (key == "width")             c.width = parseInt(value);
    else if (key == "height")       c.height = parseInt(value);
    else if (key == "grid-x")       c.grid.width = parseInt(value);
    else if (key == "grid-y")       c.grid.height = parseInt(value);
    else if (key == "segments")     c.grid.segmentsPerStrand = parseInt(value);
    else if (key == "scale")        c.noiseScale = parseFloat(value);
    else if (key == "step")         c.stepSize = parseFloat(value);
    else if (key == "radius")       c.radius = parseFloat(value);
    else if (key == "tint")         c.tint = parseFloat(value);
    else if (key == "ring-sides")   c.ringSides = parseInt(value);
    else if (key == "seed-extent")  c.seeds.extent = parseFloat(value);
    else if (key == "seed-jitter")  c.seeds.jitter = parseFloat(value);
    else if (key == "seed-plane")   c.seeds.plane = parseFloat(value);
    else if (key == "drift")        c.drift = parseVec3(value);
    else if (key == "color")        c.baseColor = glm::vec4(parseVec3(value), c.baseColor.a);
    else if (key == "light-dir")    c.lightDirection = parseVec3(value);
    else if (key == "light-color")  c.lightColor = parseVec3(value);
    else if (key == "ambient")      c.ambientColor = parseVec3(value);
    else if (key == "eye")          c.eye = parseVec3(value);
    else if (key == "target")       c.target = parseVec3(value);
    else if (key == "fov")          c.fovDegrees = parseFloat(value);
    else if (key == "frames")       c.frames = parseInt(value);
    else if (key == "threads")      c.cpuThreads = parseInt(value);
    else if (key == "shaders")      c.shaderDir = value;
    else return false;
    return true;
}

}  // namespace

bool parseArgs(int argc, char** argv, AppConfig& config, std::string& error) {
    if (config.shaderDir.empty()) config.shaderDir = FLOW_SHADER_DIR;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--cpu") {
            config.forceCpu = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }

        const size_t eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            error = "Unrecognized argument: " + arg;
            return false;
        }

        const std::string key = arg.substr(2, eq - 2);
        const std::string value = arg.substr(eq + 1);
        try {
            if (!applyOption(config, key, value)) {
                error = "Unknown option: --" + key;
                return false;
            }
        } catch (const std::exception&) {
            error = "Invalid value for --" + key + ": '" + value + "'";
            return false;
        }
    }
    return true;
}

bool validateConfig(const AppConfig& c, std::string& error) {
    std::ostringstream msg;
    std::string gridError;

    if (c.width <= 0 || c.height <= 0) {
        msg << "Window size must be positive, got " << c.width << "x" << c.height;
    } else if (c.grid.width <= 0 || c.grid.height <= 0) {
        msg << "Strand grid must be positive, got " << c.grid.width << "x" << c.grid.height;
    } else if (!isSupportedSegmentCount(c.grid.segmentsPerStrand)) {
        msg << "Unsupported segments per strand: " << c.grid.segmentsPerStrand
            << " (supported:";
        for (int count : kSupportedSegmentCounts) msg << " " << count;
        msg << ")";
    } else if (!checkGridSize(c.grid, gridError)) {
        msg << gridError;
    } else if (!(c.noiseScale > 0.0f) || !(c.stepSize > 0.0f) || !(c.radius > 0.0f)) {
        msg << "Noise scale, step size and tube radius must be positive";
    } else if (c.ringSides < 3 || c.ringSides > 64) {
        msg << "Ring sides must be in [3, 64], got " << c.ringSides;
    } else if (c.tint < 0.0f || c.tint > 1.0f) {
        msg << "Color tint must be in [0, 1], got " << c.tint;
    } else if (!(c.seeds.extent >= 0.0f) || !std::isfinite(c.seeds.plane) || !std::isfinite(c.seeds.jitter)) {
        msg << "Seed layout must be finite with a non-negative extent";
    } else if (!finite(c.drift) || !finite(c.lightDirection) || !finite(c.eye) || !finite(c.target)) {
        msg << "Drift, light direction and camera vectors must be finite";
    } else if (glm::length(c.lightDirection) == 0.0f) {
        msg << "Light direction must be non-zero";
    } else if (c.eye == c.target) {
        msg << "Camera eye and target must differ";
    } else if (!(c.fovDegrees > 0.0f && c.fovDegrees < 180.0f)) {
        msg << "Field of view must be in (0, 180), got " << c.fovDegrees;
    } else if (c.frames < 0 || c.cpuThreads < 0) {
        msg << "Frame and thread counts must not be negative";
    } else {
        return true;
    }

    error = msg.str();
    return false;
}

void printUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [--key=value ...]\n"
        << "  --width=<n> --height=<n>          color target size\n"
        << "  --grid-x=<n> --grid-y=<n>         strand grid\n"
        << "  --segments=<8|16|32|64|128>       segments per strand\n"
        << "  --scale=<f> --step=<f>            noise scale, integration step\n"
        << "  --drift=x,y,z                     field drift per second\n"
        << "  --radius=<f> --tint=<0..1>        tube radius, direction tint\n"
        << "  --ring-sides=<3..64>              sides of the tube profile\n"
        << "  --seed-extent=<f> --seed-plane=<f> --seed-jitter=<f>\n"
        << "  --color=r,g,b --light-dir=x,y,z --light-color=r,g,b --ambient=r,g,b\n"
        << "  --eye=x,y,z --target=x,y,z --fov=<deg>\n"
        << "  --frames=<n>                      stop after n frames (0 = never)\n"
        << "  --cpu --threads=<n>               CPU strand writer\n"
        << "  --shaders=<dir>                   GLSL directory\n";
}

}  // namespace flow
