#pragma once
// -----------------------------------------------------------------------------
// pipeline.hpp
//
// One frame of strands: fill the instance buffer, then draw it.
//
//   CUDA path: map the GL instance buffer -> kernel writes every record ->
//              unmap (barrier) -> instanced draw
//   CPU path:  worker threads fill a host staging buffer -> upload -> draw
//
// The path is picked once in init() from the detected capabilities. Both
// paths write the same bytes; only where they are produced differs.
// -----------------------------------------------------------------------------

#include <memory>
#include <string>
#include <vector>

#include "flow/config.hpp"
#include "flow/instance_writer.hpp"
#include "flow/layout.hpp"
#include "gl/capabilities.hpp"
#include "gl/renderer.hpp"

namespace compute {
class CudaStrandWriter;
}

namespace gl {

class StrandPipeline {
public:
    StrandPipeline(const flow::AppConfig& config, const Capabilities& caps);
    ~StrandPipeline();

    StrandPipeline(const StrandPipeline&) = delete;
    StrandPipeline& operator=(const StrandPipeline&) = delete;

    // -------------------------------------------------------------------------
    // init(error)
    // Creates the renderer and the strand writer, then runs the setup checks:
    //   - segments per strand has a compiled variant
    //   - the instance buffer holds every record of the grid
    //   - the dispatch covers every strand
    //   - the linked shader agrees with the FrameUniforms declaration
    // Any failure is a configuration error; the caller should exit.
    // -------------------------------------------------------------------------
    bool init(std::string& error);

    // -------------------------------------------------------------------------
    // renderFrame(uniforms, target)
    // Runs the compute stage then the draw. Returns false when the frame was
    // dropped (map or launch failure); `target` is left untouched then.
    // -------------------------------------------------------------------------
    bool renderFrame(const flow::FrameUniforms& uniforms, ColorTarget& target);

    // Zero sizes (minimized window) are ignored.
    void resize(int width, int height);

    float aspect() const;

    // Blits the last color target to the default framebuffer.
    void present(int windowWidth, int windowHeight) const;

    const char* writerName() const;

    // Milliseconds of the last compute stage / draw, negative if unknown.
    float lastComputeMs();
    float lastDrawMs();

    void cleanup();

private:
    bool writeOnDevice(const flow::FrameUniforms& uniforms);
    bool writeOnHost(const flow::FrameUniforms& uniforms);

    flow::AppConfig config;
    Capabilities caps;
    std::unique_ptr<Renderer> renderer;
    std::unique_ptr<flow::StrandWriter> writer;
    compute::CudaStrandWriter* cudaWriter;   // Same object as writer on the CUDA path
    std::vector<flow::Segment> staging;      // Host records for the CPU path
    float hostComputeMs;
};

}  // namespace gl
