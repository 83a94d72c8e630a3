#include "gl/pipeline.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "cuda/strand_writer.cuh"
#include "flow/frame_uniforms.hpp"
#include "flow/strand_grid.hpp"

namespace gl {

StrandPipeline::StrandPipeline(const flow::AppConfig& config, const Capabilities& caps)
    : config(config), caps(caps), cudaWriter(nullptr), hostComputeMs(-1.0f) {}

StrandPipeline::~StrandPipeline() {
    cleanup();
}

bool StrandPipeline::init(std::string& error) {
    const flow::StrandGrid& grid = config.grid;

    if (!flow::isSupportedSegmentCount(grid.segmentsPerStrand)) {
        std::ostringstream msg;
        msg << "No compiled strand variant for " << grid.segmentsPerStrand << " segments per strand";
        error = msg.str();
        return false;
    }
    if (!flow::checkGridSize(grid, error)) return false;

    // -----------------------------
    // Renderer (instance buffer sized by the static formula)
    // -----------------------------
    const bool useCuda = caps.cuda.available && !config.forceCpu;
    renderer.reset(new Renderer(config.width, config.height, config.ringSides, grid.segments(),
                                config.shaderDir, useCuda, caps.timerQuery));
    if (!renderer->valid()) {
        error = "Failed to create the tube renderer";
        return false;
    }

    if (!renderer->validateLayout(error)) return false;
    if (!flow::checkBufferCapacity(grid, renderer->instanceBufferBytes(), error)) return false;

    // -----------------------------
    // Strand writer
    // -----------------------------
    if (useCuda && renderer->cudaInteropActive()) {
        if (!flow::checkDispatchCoverage(grid, flow::computeDispatch(grid), error)) return false;
        cudaWriter = new compute::CudaStrandWriter(caps.timerQuery);
        writer.reset(cudaWriter);
    } else {
        if (useCuda) {
            std::cerr << "CUDA interop unavailable, strands are generated on the CPU" << std::endl;
        }
        staging.resize(grid.segments());
        if (!flow::checkBufferCapacity(grid, staging.size() * sizeof(flow::Segment), error)) return false;
        writer.reset(new flow::CpuStrandWriter(config.cpuThreads));
    }

    std::cout << "Strand writer: " << writer->name() << " (" << grid.width << "x" << grid.height
              << " strands, " << grid.segmentsPerStrand << " segments, "
              << grid.segments() << " instances)" << std::endl;
    return true;
}

bool StrandPipeline::renderFrame(const flow::FrameUniforms& uniforms, ColorTarget& target) {
    if (!renderer || !writer) return false;

    // No color target (its recreation failed on the last resize, already reported)
    if (!renderer->valid()) return false;

    // The buffers were sized for the configured grid only
    const flow::StrandGrid grid = flow::strandGrid(uniforms);
    if (grid.width != config.grid.width || grid.height != config.grid.height ||
        grid.segmentsPerStrand != config.grid.segmentsPerStrand) {
        std::cerr << "renderFrame: uniforms describe a " << grid.width << "x" << grid.height << "x"
                  << grid.segmentsPerStrand << " grid, buffers were sized for "
                  << config.grid.width << "x" << config.grid.height << "x"
                  << config.grid.segmentsPerStrand << std::endl;
        return false;
    }

    // ---------------------------------------------------------------------
    // STAGE A: fill the instance buffer
    // ---------------------------------------------------------------------
    const bool written = writer->writesDeviceMemory() ? writeOnDevice(uniforms) : writeOnHost(uniforms);
    if (!written) return false;

    // ---------------------------------------------------------------------
    // STAGE B: instanced tube draw, strictly after the writes are visible
    // ---------------------------------------------------------------------
    target = renderer->draw(uniforms, grid.segments());
    return true;
}

bool StrandPipeline::writeOnDevice(const flow::FrameUniforms& uniforms) {
    flow::Segment* devPtr = renderer->mapCudaResource();
    if (!devPtr) return false;

    const bool launched = writer->write(devPtr, uniforms);

    // Unmap even when the launch failed, GL cannot draw from a mapped buffer
    const bool unmapped = renderer->unmapCudaResource();
    return launched && unmapped;
}

bool StrandPipeline::writeOnHost(const flow::FrameUniforms& uniforms) {
    const auto start = std::chrono::high_resolution_clock::now();
    if (!writer->write(staging.data(), uniforms)) return false;
    hostComputeMs = std::chrono::duration<float, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();

    return renderer->uploadInstances(staging.data(), staging.size());
}

void StrandPipeline::resize(int width, int height) {
    if (width <= 0 || height <= 0) return;
    config.width = width;
    config.height = height;
    if (renderer) renderer->resize(width, height);
}

float StrandPipeline::aspect() const {
    return static_cast<float>(config.width) / static_cast<float>(config.height);
}

void StrandPipeline::present(int windowWidth, int windowHeight) const {
    if (renderer) renderer->present(windowWidth, windowHeight);
}

const char* StrandPipeline::writerName() const {
    return writer ? writer->name() : "none";
}

float StrandPipeline::lastComputeMs() {
    if (cudaWriter) return cudaWriter->lastKernelMs();
    return hostComputeMs;
}

float StrandPipeline::lastDrawMs() {
    return renderer ? renderer->lastDrawMs() : -1.0f;
}

void StrandPipeline::cleanup() {
    writer.reset();
    cudaWriter = nullptr;
    staging.clear();
    if (renderer) {
        renderer->cleanup();
        renderer.reset();
    }
}

}  // namespace gl
