#pragma once
// -----------------------------------------------------------------------------
// instance_writer.hpp
//
// Base class for everything that fills the instance buffer. The CUDA kernel
// writer and the CPU thread writer both implement it. The pipeline only talks
// to this interface, so the writer can be chosen at runtime from the detected
// capabilities without touching the rendering code.
//
// Both writers run the same per-strand body, writeStrand(), once per worker.
// -----------------------------------------------------------------------------

#include <functional>
#include <thread>

#include "flow/frame_uniforms.hpp"
#include "flow/host_device.hpp"
#include "flow/layout.hpp"
#include "flow/streamline.hpp"
#include "flow/strand_grid.hpp"

namespace flow {

// -----------------------------------------------------------------------------
// writeStrand(buffer, x, y, u, segmentsPerStrand)
// Body of one worker: integrates the strand seeded at grid cell (x, y) and
// writes its records to buffer[strandOffset .. strandOffset + segments - 1].
// The CUDA kernel passes segmentsPerStrand as a compile-time constant.
// -----------------------------------------------------------------------------
FLOW_HD inline void writeStrand(Segment* buffer, int x, int y, const FrameUniforms& u, int segmentsPerStrand) {
    StrandGrid grid = strandGrid(u);
    grid.segmentsPerStrand = segmentsPerStrand;

    const size_t strand = strandIndex(x, y, grid);
    const glm::vec3 seed = seedPosition(x, y, grid, seedLayout(u));
    integrateStrand(seed, segmentsPerStrand, u.stepSize, fieldParams(u), segmentStyle(u),
                    buffer + strandOffset(strand, grid));
}

class StrandWriter {
public:
    virtual ~StrandWriter() = default;

    // -------------------------------------------------------------------------
    // write(buffer, uniforms)
    // Fills every record of the grid described by `uniforms`. The buffer must
    // already have passed checkBufferCapacity(). Returns false when the work
    // could not be issued; the frame is then dropped.
    // -------------------------------------------------------------------------
    virtual bool write(Segment* buffer, const FrameUniforms& uniforms) = 0;

    // True when `buffer` must be a device pointer (mapped GL buffer).
    virtual bool writesDeviceMemory() const = 0;

    virtual const char* name() const = 0;
};

// -----------------------------------------------------------------------------
// CpuStrandWriter
// Splits the strand index range into contiguous blocks, one per thread. Each
// thread writes only the records of its own strands.
// -----------------------------------------------------------------------------
class CpuStrandWriter : public StrandWriter {
public:
    // threads == 0 picks std::thread::hardware_concurrency().
    explicit CpuStrandWriter(int threads = 0);

    bool write(Segment* buffer, const FrameUniforms& uniforms) override;
    bool writesDeviceMemory() const override { return false; }
    const char* name() const override { return "cpu"; }

    int threads() const { return m_threads; }

protected:
    // Starts one worker. Throws std::system_error when no thread can be
    // created; write() then joins the workers already running and fails.
    virtual std::thread startWorker(std::function<void()> work);

private:
    int m_threads;
};

}  // namespace flow
