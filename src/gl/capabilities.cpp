#include "gl/capabilities.hpp"

#include <iostream>
#include <sstream>

#include <glad/gl.h>

namespace gl {

Capabilities detectCapabilities(bool queryCuda) {
    Capabilities caps;

    glGetIntegerv(GL_MAJOR_VERSION, &caps.glMajor);
    glGetIntegerv(GL_MINOR_VERSION, &caps.glMinor);

    const GLubyte* renderer = glGetString(GL_RENDERER);
    if (renderer) caps.glRenderer = reinterpret_cast<const char*>(renderer);

    // Zero counter bits means elapsed-time queries are not backed by hardware
    GLint bits = 0;
    glGetQueryiv(GL_TIME_ELAPSED, GL_QUERY_COUNTER_BITS, &bits);
    caps.timerQuery = glGetError() == GL_NO_ERROR && bits > 0;

    if (queryCuda) {
        caps.cuda = compute::selectDevice();
    }
    return caps;
}

bool checkRequirements(const Capabilities& caps, std::string& error) {
    if (caps.glMajor > 4 || (caps.glMajor == 4 && caps.glMinor >= 3)) return true;

    std::ostringstream msg;
    msg << "OpenGL 4.3 core is required, context reports " << caps.glMajor << "." << caps.glMinor;
    error = msg.str();
    return false;
}

void reportCapabilities(const Capabilities& caps) {
    std::cout << "Renderer: " << caps.glRenderer
              << " (OpenGL " << caps.glMajor << "." << caps.glMinor << ")" << std::endl;

    if (caps.cuda.available) {
        std::cout << "CUDA device " << caps.cuda.index << ": " << caps.cuda.name
                  << " (sm_" << caps.cuda.computeMajor << caps.cuda.computeMinor << ")" << std::endl;
    } else {
        std::cout << "CUDA device: none, strands are generated on the CPU" << std::endl;
    }

    if (!caps.timerQuery) {
        std::cout << "GPU timer queries unavailable, timing disabled" << std::endl;
    }
}

}  // namespace gl
