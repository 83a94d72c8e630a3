#pragma once
// -----------------------------------------------------------------------------
// renderer.hpp
//
// OpenGL + CUDA interoperability renderer for the strand tubes.
// This class is responsible for:
//   1) Creating the instance buffer (one flow::Segment per tube instance)
//   2) Registering it with CUDA and mapping/unmapping it for kernel writes
//   3) Drawing the shared ring mesh once per instance into an offscreen
//      color target, lit by a single directional light
//   4) Presenting that color target in the window
//
// The instance buffer never leaves the GPU on the CUDA path: the kernel writes
// through the mapped pointer, and the unmap is the barrier before the draw
// reads it.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>

#include <glad/gl.h>
#include <cuda_gl_interop.h>

#include "flow/layout.hpp"

namespace gl {

// The rendered image of one frame. Owned by the Renderer, valid until the
// next resize().
struct ColorTarget {
    GLuint texture = 0;
    int width = 0;
    int height = 0;
};

class Renderer {
public:
    // -------------------------------------------------------------------------
    // Constructor
    // width/height: color target size
    // ringSides: sides of the shared tube profile
    // instanceCapacity: number of Segment records the instance buffer holds
    // shaderDir: directory containing tube.vert / tube.frag
    // cudaInterop: register the instance buffer with CUDA
    // gpuTiming: time each draw with GL_TIME_ELAPSED queries
    // -------------------------------------------------------------------------
    Renderer(int width, int height, int ringSides, size_t instanceCapacity,
             const std::string& shaderDir, bool cudaInterop, bool gpuTiming);

    // -------------------------------------------------------------------------
    // Destructor
    // Releases GL objects and the CUDA registration.
    // -------------------------------------------------------------------------
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // True when every GL object was created (program, buffers, target).
    bool valid() const;

    // True when the instance buffer is registered with CUDA.
    bool cudaInteropActive() const { return cudaInstances != nullptr; }

    // Size of the instance buffer as reported by the driver.
    size_t instanceBufferBytes() const;

    // -------------------------------------------------------------------------
    // validateLayout(error)
    // Compares the byte offsets the linked program assigns to every
    // FrameUniforms member with the C++ declaration.
    // -------------------------------------------------------------------------
    bool validateLayout(std::string& error) const;

    // -------------------------------------------------------------------------
    // mapCudaResource()
    // Maps the instance buffer to CUDA and returns a device pointer, or
    // nullptr on failure.
    //
    // Usage:
    //    flow::Segment* devPtr = renderer.mapCudaResource();
    //    writer.write(devPtr, uniforms);
    //    renderer.unmapCudaResource();
    // -------------------------------------------------------------------------
    flow::Segment* mapCudaResource();

    // -------------------------------------------------------------------------
    // unmapCudaResource()
    // Unmaps the instance buffer so OpenGL can safely read it. Must be called
    // after the kernel is enqueued, before draw().
    // -------------------------------------------------------------------------
    bool unmapCudaResource();

    // Copies host-written records into the instance buffer (CPU writer path).
    bool uploadInstances(const flow::Segment* records, size_t count);

    // -------------------------------------------------------------------------
    // draw(uniforms, instanceCount)
    // Uploads the uniform block and draws `instanceCount` tubes into the
    // offscreen target. Returns that target.
    // -------------------------------------------------------------------------
    ColorTarget draw(const flow::FrameUniforms& uniforms, size_t instanceCount);

    // Copies the color target onto the default framebuffer.
    void present(int windowWidth, int windowHeight) const;

    // Recreates the color target at the new size. Zero sizes are ignored. A
    // failed recreation leaves the renderer invalid until the next resize.
    void resize(int newWidth, int newHeight);

    int targetWidth() const { return width; }
    int targetHeight() const { return height; }

    // Duration of the last finished draw in milliseconds, negative if unknown.
    float lastDrawMs();

    // -------------------------------------------------------------------------
    // cleanup()
    // Frees OpenGL buffers, textures, VAO, and unregisters the instance
    // buffer from CUDA.
    // -------------------------------------------------------------------------
    void cleanup();

private:
    void initGLResources(int ringSides, const std::string& shaderDir, bool cudaInterop);
    bool createTarget();
    void destroyTarget();

private:
    int width, height;                     // Color target size
    size_t instanceCapacity;               // Records in the instance buffer
    GLuint glProgram;                      // Tube shader program
    GLuint vao;                            // Ring mesh + instance attribute bindings
    GLuint ringVbo;                        // Ring profile vertices
    GLuint ringIbo;                        // Ring triangle indices
    GLsizei ringIndexCount;
    GLuint instanceVbo;                    // Segment records (CUDA writes here)
    GLuint ubo;                            // FrameUniforms block
    GLuint fbo;                            // Offscreen target
    GLuint colorTex;
    GLuint depthRbo;
    GLuint timerQuery;                     // 0 when timing is disabled
    bool timerPending;
    cudaGraphicsResource* cudaInstances;   // CUDA handle for the instance buffer
};

}  // namespace gl
