#pragma once
// -----------------------------------------------------------------------------
// capabilities.hpp
//
// What the machine can do, checked once after the GL context exists:
//   - a CUDA device (GPU strand generation; otherwise the CPU writer is used)
//   - the GL version (4.3 core is required to render at all)
//   - GPU timer queries (otherwise only the FPS counter is shown)
// -----------------------------------------------------------------------------

#include <string>

#include "cuda/cuda_utils.cuh"

namespace gl {

struct Capabilities {
    compute::DeviceInfo cuda;
    int glMajor = 0;
    int glMinor = 0;
    bool timerQuery = false;
    std::string glRenderer;
};

// -----------------------------------------------------------------------------
// detectCapabilities(queryCuda)
// Requires a current GL context. With queryCuda == false the CUDA device is
// reported unavailable without touching the runtime.
// -----------------------------------------------------------------------------
Capabilities detectCapabilities(bool queryCuda);

// Fails when rendering is impossible on this context.
bool checkRequirements(const Capabilities& caps, std::string& error);

// One line per capability to std::cout.
void reportCapabilities(const Capabilities& caps);

}  // namespace gl
